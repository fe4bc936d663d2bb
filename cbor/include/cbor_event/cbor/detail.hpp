#pragma once

#include <cstddef>
#include <cstdint>

namespace cbe {

constexpr const uint8_t CBOR_NON_NEGATIVE_INTEGER = 0;
constexpr const uint8_t CBOR_NEGATIVE_INTEGER = 1;
constexpr const uint8_t CBOR_BYTE_STRING = 2;
constexpr const uint8_t CBOR_TEXT_STRING = 3;
constexpr const uint8_t CBOR_ARRAY = 4;
constexpr const uint8_t CBOR_MAP = 5;
constexpr const uint8_t CBOR_TAG = 6;
constexpr const uint8_t CBOR_EVERYTHING_ELSE = 7;

constexpr const uint8_t CBOR_MAX_INLINE_VALUE = 23;
constexpr const uint8_t CBOR_PAYLOAD_LENGTH_U8 = 24;
constexpr const uint8_t CBOR_PAYLOAD_LENGTH_U16 = 25;
constexpr const uint8_t CBOR_PAYLOAD_LENGTH_U32 = 26;
constexpr const uint8_t CBOR_PAYLOAD_LENGTH_U64 = 27;
constexpr const uint8_t CBOR_INDEFINITE_LENGTH = 31;

constexpr const uint8_t CBOR_VALUE_FALSE = 20;
constexpr const uint8_t CBOR_VALUE_TRUE = 21;
constexpr const uint8_t CBOR_VALUE_NULL = 22;
constexpr const uint8_t CBOR_VALUE_UNDEFINED = 23;
constexpr const uint8_t CBOR_VALUE_SIMPLE_U8 = 24;
constexpr const uint8_t CBOR_VALUE_FLOAT16 = 25;
constexpr const uint8_t CBOR_VALUE_FLOAT32 = 26;
constexpr const uint8_t CBOR_VALUE_FLOAT64 = 27;
constexpr const uint8_t CBOR_VALUE_BREAK = 31;

constexpr const uint8_t CBOR_BREAK_BYTE = 0xff;

// Nesting limit when decoding into cbor_value, so that adversarial input
// can't exhaust the stack
constexpr const size_t CBOR_MAX_VALUE_DEPTH = 64;

// Largest header: one initial byte followed by an 8-byte argument
constexpr const size_t CBOR_MAX_HEADER_SIZE = 9;

constexpr uint8_t make_initial_byte(uint8_t major_type, uint8_t additional_info) {
    return static_cast<uint8_t>(((major_type << 5) & 0b111'00000) | (additional_info & 0b000'11111));
}

// Writes the canonical (smallest width) header for `major_type` carrying
// `raw_value` into `out`, which must hold CBOR_MAX_HEADER_SIZE bytes.
// Returns the number of bytes used.
size_t encode_header_into(uint8_t* out, uint8_t major_type, uint64_t raw_value);

// Returns the length of the valid UTF-8 prefix of the buffer; the whole buffer
// is valid UTF-8 iff the result equals `length`.
size_t utf8_valid_up_to(const uint8_t* buffer, size_t length);

}  // namespace cbe
