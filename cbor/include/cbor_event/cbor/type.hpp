#pragma once

#include <cbor_event/cbor/detail.hpp>

#include <cstdint>
#include <ostream>
#include <string_view>

namespace cbe {

// The eight CBOR major types, valued by their 3-bit prefix.
enum class cbor_type : uint8_t {
    unsigned_integer = CBOR_NON_NEGATIVE_INTEGER,
    negative_integer = CBOR_NEGATIVE_INTEGER,
    bytes = CBOR_BYTE_STRING,
    text = CBOR_TEXT_STRING,
    array = CBOR_ARRAY,
    map = CBOR_MAP,
    tag = CBOR_TAG,
    special = CBOR_EVERYTHING_ELSE,
};

constexpr cbor_type cbor_type_from_initial_byte(uint8_t initial_byte) {
    return static_cast<cbor_type>(initial_byte >> 5);
}

constexpr uint8_t major_type_of(cbor_type type) {
    return static_cast<uint8_t>(type);
}

std::string_view to_string(cbor_type type);

std::ostream& operator<<(std::ostream& os, cbor_type type);

}  // namespace cbe
