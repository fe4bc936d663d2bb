#include "cbor_event/cbor/types/array.hpp"

#include "cbor_event/cbor/serialize.hpp"
#include "cbor_event/cbor/types/value.hpp"

namespace cbe {

cbor_array::cbor_array(raw_cbor& raw, size_t depth) {
    cbor_len len = raw.array();
    _indefinite = len.is_indefinite();

    if (len.is_finite()) {
        _array.reserve(detail::reservation_for(raw, len));

        for (uint64_t i = 0; i < len.length(); i++) {
            _array.emplace_back(raw, depth + 1);
        }
    } else {
        while (!raw.at_break()) {
            _array.emplace_back(raw, depth + 1);
        }

        raw.break_();
    }
}

cbor_array::cbor_array(const std::vector<cbor_value>& vec)
    : _array(vec.cbegin(), vec.cend()) {}

cbor_array::cbor_array(std::initializer_list<cbor_value> list)
    : _array(list.begin(), list.end()) {}

void cbor_array::push_back(cbor_value val) {
    _array.push_back(std::move(val));
}

bool cbor_array::operator==(const cbor_array& rhs) const { return _array == rhs._array; }
bool cbor_array::operator<(const cbor_array& rhs) const { return _array < rhs._array; }

std::string cbor_array::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_array::dump_debug(std::stringstream& ss) const {
    ss << '[';

    bool first = true;
    for (auto&& value : _array) {
        if (!first) {
            ss << ", ";
        }

        value.dump_debug(ss);
        first = false;
    }

    ss << ']';
}

}  // namespace cbe
