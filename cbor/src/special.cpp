#include "cbor_event/cbor/special.hpp"

#include "cbor_event/cbor/error.hpp"

namespace cbe {

bool cbor_special::bool_value() const {
    if (_kind != kind::boolean) {
        throw cbor_error::expected(cbor_expectation::boolean);
    }

    return _value != 0;
}

uint8_t cbor_special::unassigned_value() const {
    if (_kind != kind::unassigned) {
        throw cbor_error::expected(cbor_expectation::unassigned);
    }

    return _value;
}

std::ostream& operator<<(std::ostream& os, const cbor_special& special) {
    switch (special.type()) {
        case cbor_special::kind::boolean: return os << (special.bool_value() ? "true" : "false");
        case cbor_special::kind::null: return os << "null";
        case cbor_special::kind::undefined: return os << "undefined";
        case cbor_special::kind::unassigned:
            return os << "simple(" << static_cast<unsigned>(special.unassigned_value()) << ")";
        case cbor_special::kind::break_: return os << "break";
    }

    return os;
}

}  // namespace cbe
