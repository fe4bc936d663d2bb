#include "cbor_event/cbor/types/value.hpp"

#include <iostream>
#include <sstream>

namespace cbe {

namespace {

cbor_value::storage_type parse_storage(raw_cbor& raw, size_t depth) {
    if (depth > CBOR_MAX_VALUE_DEPTH) {
        throw cbor_error::depth_limit_exceeded(CBOR_MAX_VALUE_DEPTH);
    }

    switch (raw.peek_type()) {
        case cbor_type::unsigned_integer:
        case cbor_type::negative_integer:
            return cbor_integer{raw};
        case cbor_type::bytes:
            return cbor_byte_string{raw};
        case cbor_type::text:
            return cbor_text_string{raw};
        case cbor_type::array:
            return cbor_array{raw, depth};
        case cbor_type::map:
            return cbor_map{raw, depth};
        case cbor_type::tag:
            return cbor_tag{raw, depth};
        case cbor_type::special: {
            size_t index = raw.index();
            cbor_special special = raw.special();
            if (special.is_break()) {
                throw cbor_error::custom(
                    fmt::format("unexpected break at byte {} outside of an indefinite-length item", index)
                );
            }

            return special;
        }
    }

    throw cbor_error::custom("unrecognized cbor major type");
}

}  // namespace

cbor_value::cbor_value(raw_cbor& raw, size_t depth) : _storage(parse_storage(raw, depth)) {}

cbor_type cbor_value::type() const {
    return std::visit([](const auto& value) -> cbor_type {
        using value_type = remove_cvref_t<decltype(value)>;

        if constexpr (std::is_same_v<value_type, cbor_integer>) {
            return value.type();
        } else if constexpr (std::is_same_v<value_type, cbor_byte_string>) {
            return cbor_type::bytes;
        } else if constexpr (std::is_same_v<value_type, cbor_text_string>) {
            return cbor_type::text;
        } else if constexpr (std::is_same_v<value_type, cbor_array>) {
            return cbor_type::array;
        } else if constexpr (std::is_same_v<value_type, cbor_map>) {
            return cbor_type::map;
        } else if constexpr (std::is_same_v<value_type, cbor_tag>) {
            return cbor_type::tag;
        } else {
            return cbor_type::special;
        }
    }, _storage);
}

std::string cbor_value::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_value::dump_debug(std::stringstream& ss) const {
    std::visit([&](auto&& value) {
        if constexpr (std::is_same_v<remove_cvref_t<decltype(value)>, cbor_special>) {
            ss << value;
        } else {
            value.dump_debug(ss);
        }
    }, _storage);
}

bool cbor_value::operator==(const cbor_value& rhs) const {
    return _storage == rhs._storage;
}

bool cbor_value::operator<(const cbor_value& rhs) const {
    return _storage < rhs._storage;
}

}  // namespace cbe
