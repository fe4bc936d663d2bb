#include "cbor_event/cbor/error.hpp"

#include <cbor_event/format.hpp>

namespace cbe {

namespace {

std::string_view expected_message(cbor_expectation expectation) {
    switch (expectation) {
        case cbor_expectation::u8: return "expected 8bit long unsigned integer";
        case cbor_expectation::u16: return "expected 16bit long unsigned integer";
        case cbor_expectation::u32: return "expected 32bit long unsigned integer";
        case cbor_expectation::u64: return "expected 64bit long unsigned integer";
        case cbor_expectation::i8: return "expected 8bit long negative integer";
        case cbor_expectation::i16: return "expected 16bit long negative integer";
        case cbor_expectation::i32: return "expected 32bit long negative integer";
        case cbor_expectation::i64: return "expected 64bit long negative integer";
        case cbor_expectation::boolean: return "expected special type value `Bool'";
        case cbor_expectation::null: return "expected special type value `Null'";
        case cbor_expectation::undefined: return "expected special type value `Undefined'";
        case cbor_expectation::unassigned: return "expected special type value `Unassigned'";
        case cbor_expectation::floating_point: return "floating point special values are not supported";
        case cbor_expectation::break_: return "expected special type value `Break'";
    }

    return "unexpected value";
}

}  // namespace

cbor_error cbor_error::expected(cbor_expectation expectation) {
    return cbor_error{
        to_error_code(expectation),
        fmt::format("Invalid cbor: {}", expected_message(expectation))
    };
}

cbor_error cbor_error::not_enough(size_t have, size_t want) {
    cbor_error error{
        cbor_error_code::not_enough,
        fmt::format(
            "Invalid cbor: not enough bytes, expect {} bytes but received {} bytes.", want, have
        )
    };
    error._have = have;
    error._want = want;
    return error;
}

cbor_error cbor_error::expected_type(cbor_type expected, cbor_type actual) {
    cbor_error error{
        cbor_error_code::expected_type,
        fmt::format(
            "Invalid cbor: not the right type, expected `{}' byte received `{}'.",
            to_string(expected), to_string(actual)
        )
    };
    error._expected_type = expected;
    error._actual_type = actual;
    return error;
}

cbor_error cbor_error::unsupported_key_type(cbor_type actual) {
    cbor_error error{
        cbor_error_code::unsupported_key_type,
        fmt::format("Invalid cbor: unsupported object key type `{}'.", to_string(actual))
    };
    error._actual_type = actual;
    return error;
}

cbor_error cbor_error::unknown_len_type(uint8_t additional_info) {
    cbor_error error{
        cbor_error_code::unknown_len_type,
        fmt::format("Invalid cbor: not the right sub type: 0b{:05b}", additional_info)
    };
    error._additional_info = additional_info;
    return error;
}

cbor_error cbor_error::indefinite_len_not_supported(cbor_type type) {
    cbor_error error{
        cbor_error_code::indefinite_len_not_supported,
        fmt::format(
            "Invalid cbor: indefinite length not supported for cbor object of type `{}'.",
            to_string(type)
        )
    };
    error._actual_type = type;
    return error;
}

cbor_error cbor_error::invalid_text(size_t valid_up_to) {
    cbor_error error{
        cbor_error_code::invalid_text,
        fmt::format(
            "Invalid cbor: expected a valid utf8 string text, invalid sequence after {} bytes.",
            valid_up_to
        )
    };
    error._have = valid_up_to;
    return error;
}

cbor_error cbor_error::write_error(size_t have, size_t want) {
    cbor_error error{
        cbor_error_code::write_error,
        fmt::format(
            "Invalid cbor: write error: cannot write {} bytes, only {} bytes of capacity left.",
            want, have
        )
    };
    error._have = have;
    error._want = want;
    return error;
}

cbor_error cbor_error::depth_limit_exceeded(size_t limit) {
    cbor_error error{
        cbor_error_code::depth_limit_exceeded,
        fmt::format("Invalid cbor: nesting deeper than {} levels.", limit)
    };
    error._want = limit;
    return error;
}

cbor_error cbor_error::custom(const std::string& message) {
    return cbor_error{cbor_error_code::custom, fmt::format("Invalid cbor: {}", message)};
}

std::string_view to_string(cbor_error_code code) {
    switch (code) {
        case cbor_error_code::expected_u8: return "expected_u8";
        case cbor_error_code::expected_u16: return "expected_u16";
        case cbor_error_code::expected_u32: return "expected_u32";
        case cbor_error_code::expected_u64: return "expected_u64";
        case cbor_error_code::expected_i8: return "expected_i8";
        case cbor_error_code::expected_i16: return "expected_i16";
        case cbor_error_code::expected_i32: return "expected_i32";
        case cbor_error_code::expected_i64: return "expected_i64";
        case cbor_error_code::expected_bool: return "expected_bool";
        case cbor_error_code::expected_null: return "expected_null";
        case cbor_error_code::expected_undefined: return "expected_undefined";
        case cbor_error_code::expected_unassigned: return "expected_unassigned";
        case cbor_error_code::expected_float: return "expected_float";
        case cbor_error_code::expected_break: return "expected_break";
        case cbor_error_code::not_enough: return "not_enough";
        case cbor_error_code::expected_type: return "expected_type";
        case cbor_error_code::unsupported_key_type: return "unsupported_key_type";
        case cbor_error_code::unknown_len_type: return "unknown_len_type";
        case cbor_error_code::indefinite_len_not_supported: return "indefinite_len_not_supported";
        case cbor_error_code::invalid_text: return "invalid_text";
        case cbor_error_code::write_error: return "write_error";
        case cbor_error_code::depth_limit_exceeded: return "depth_limit_exceeded";
        case cbor_error_code::custom: return "custom";
    }

    return "unknown";
}

std::ostream& operator<<(std::ostream& os, cbor_error_code code) {
    return os << to_string(code);
}

}  // namespace cbe
