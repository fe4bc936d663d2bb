#pragma once

#include <cbor_event/cbor/type.hpp>

#include <cbor_event/util.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace cbe {

enum class cbor_error_code {
    expected_u8,
    expected_u16,
    expected_u32,
    expected_u64,
    expected_i8,
    expected_i16,
    expected_i32,
    expected_i64,
    expected_bool,
    expected_null,
    expected_undefined,
    expected_unassigned,
    expected_float,
    expected_break,

    // Not enough input; have() is what remains, want() what the item needs
    not_enough,
    // Wrong major type; expected_cbor_type() vs actual_cbor_type()
    expected_type,
    // Map key that is not an integer, byte string or text string
    unsupported_key_type,
    // Reserved additional info (28-30), or 31 where it has no meaning
    unknown_len_type,
    indefinite_len_not_supported,
    // Text payload is not UTF-8; valid_up_to() is the valid prefix length
    invalid_text,
    // Sink rejected a write; have() is the spare capacity, want() the write size
    write_error,
    depth_limit_exceeded,

    custom,
};

// The error codes that carry no payload beyond the code itself
enum class cbor_expectation {
    u8,
    u16,
    u32,
    u64,
    i8,
    i16,
    i32,
    i64,
    boolean,
    null,
    undefined,
    unassigned,
    floating_point,
    break_,
};

constexpr cbor_error_code to_error_code(cbor_expectation expectation) {
    switch (expectation) {
        case cbor_expectation::u8: return cbor_error_code::expected_u8;
        case cbor_expectation::u16: return cbor_error_code::expected_u16;
        case cbor_expectation::u32: return cbor_error_code::expected_u32;
        case cbor_expectation::u64: return cbor_error_code::expected_u64;
        case cbor_expectation::i8: return cbor_error_code::expected_i8;
        case cbor_expectation::i16: return cbor_error_code::expected_i16;
        case cbor_expectation::i32: return cbor_error_code::expected_i32;
        case cbor_expectation::i64: return cbor_error_code::expected_i64;
        case cbor_expectation::boolean: return cbor_error_code::expected_bool;
        case cbor_expectation::null: return cbor_error_code::expected_null;
        case cbor_expectation::undefined: return cbor_error_code::expected_undefined;
        case cbor_expectation::unassigned: return cbor_error_code::expected_unassigned;
        case cbor_expectation::floating_point: return cbor_error_code::expected_float;
        case cbor_expectation::break_: return cbor_error_code::expected_break;
    }

    return cbor_error_code::custom;
}

class cbor_error : public std::runtime_error {
public:
    static cbor_error expected(cbor_expectation expectation);
    static cbor_error not_enough(size_t have, size_t want);
    static cbor_error expected_type(cbor_type expected, cbor_type actual);
    static cbor_error unsupported_key_type(cbor_type actual);
    static cbor_error unknown_len_type(uint8_t additional_info);
    static cbor_error indefinite_len_not_supported(cbor_type type);
    static cbor_error invalid_text(size_t valid_up_to);
    static cbor_error write_error(size_t have, size_t want);
    static cbor_error depth_limit_exceeded(size_t limit);
    static cbor_error custom(const std::string& message);

    COPYABLE(cbor_error);
    MOVABLE(cbor_error);

    cbor_error_code code() const { return _code; }

    size_t have() const { return _have; }
    size_t want() const { return _want; }
    cbor_type expected_cbor_type() const { return _expected_type; }
    cbor_type actual_cbor_type() const { return _actual_type; }
    uint8_t additional_info() const { return _additional_info; }
    size_t valid_up_to() const { return _have; }

private:
    cbor_error(cbor_error_code code, const std::string& message)
        : std::runtime_error(message), _code(code) {}

    cbor_error_code _code;
    size_t _have{0};
    size_t _want{0};
    cbor_type _expected_type{cbor_type::special};
    cbor_type _actual_type{cbor_type::special};
    uint8_t _additional_info{0};
};

std::string_view to_string(cbor_error_code code);

std::ostream& operator<<(std::ostream& os, cbor_error_code code);

// Expectation raised when a decoded integer does not fit in T
template <typename T>
constexpr cbor_expectation narrowing_expectation() {
    static_assert(std::is_integral_v<T> && sizeof(T) <= sizeof(uint64_t));

    if constexpr (std::is_unsigned_v<T>) {
        switch (sizeof(T)) {
            case 1: return cbor_expectation::u8;
            case 2: return cbor_expectation::u16;
            case 4: return cbor_expectation::u32;
            default: return cbor_expectation::u64;
        }
    } else {
        switch (sizeof(T)) {
            case 1: return cbor_expectation::i8;
            case 2: return cbor_expectation::i16;
            case 4: return cbor_expectation::i32;
            default: return cbor_expectation::i64;
        }
    }
}

}  // namespace cbe
