#include "cbor_event/cbor/type.hpp"

namespace cbe {

std::string_view to_string(cbor_type type) {
    switch (type) {
        case cbor_type::unsigned_integer: return "UnsignedInteger";
        case cbor_type::negative_integer: return "NegativeInteger";
        case cbor_type::bytes: return "Bytes";
        case cbor_type::text: return "Text";
        case cbor_type::array: return "Array";
        case cbor_type::map: return "Map";
        case cbor_type::tag: return "Tag";
        case cbor_type::special: return "Special";
    }

    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, cbor_type type) {
    return os << to_string(type);
}

}  // namespace cbe
