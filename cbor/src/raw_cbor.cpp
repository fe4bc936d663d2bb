#include "cbor_event/cbor/raw_cbor.hpp"

#include "cbor_event/cbor/detail.hpp"

#include <cbor_event/binary_io.hpp>
#include <cbor_event/format.hpp>
#include <cbor_event/util.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace cbe {

namespace {

constexpr size_t argument_width(uint8_t additional_info) {
    switch (additional_info) {
        case CBOR_PAYLOAD_LENGTH_U8: return 1;
        case CBOR_PAYLOAD_LENGTH_U16: return 2;
        case CBOR_PAYLOAD_LENGTH_U32: return 4;
        case CBOR_PAYLOAD_LENGTH_U64: return 8;
        default: return 0;
    }
}

}  // namespace

cbor_type raw_cbor::peek_type() const {
    return cbor_type_from_initial_byte(_peek_initial_byte());
}

bool raw_cbor::at_break() const {
    return _peek_initial_byte() == CBOR_BREAK_BYTE;
}

uint64_t raw_cbor::unsigned_integer() {
    auto [additional_info, value] = _read_argument(cbor_type::unsigned_integer);
    if (additional_info == CBOR_INDEFINITE_LENGTH) {
        _fail(cbor_error::unknown_len_type(additional_info));
    }

    return value;
}

int64_t raw_cbor::negative_integer() {
    uint64_t raw_value = negative_integer_raw();
    if (raw_value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        _fail(cbor_error::expected(cbor_expectation::i64));
    }

    return -1 - static_cast<int64_t>(raw_value);
}

uint64_t raw_cbor::negative_integer_raw() {
    auto [additional_info, raw_value] = _read_argument(cbor_type::negative_integer);
    if (additional_info == CBOR_INDEFINITE_LENGTH) {
        _fail(cbor_error::unknown_len_type(additional_info));
    }

    return raw_value;
}

byte_span raw_cbor::bytes() {
    auto [additional_info, length] = _read_argument(cbor_type::bytes);
    if (additional_info == CBOR_INDEFINITE_LENGTH) {
        _fail(cbor_error::indefinite_len_not_supported(cbor_type::bytes));
    }

    if (length > bytes_remaining()) {
        _fail(cbor_error::not_enough(bytes_remaining(), length));
    }

    byte_span result = _buffer.subspan(_pos, length);
    _pos += length;
    return result;
}

std::string_view raw_cbor::text() {
    auto [additional_info, length] = _read_argument(cbor_type::text);
    if (additional_info == CBOR_INDEFINITE_LENGTH) {
        _fail(cbor_error::indefinite_len_not_supported(cbor_type::text));
    }

    if (length > bytes_remaining()) {
        _fail(cbor_error::not_enough(bytes_remaining(), length));
    }

    const uint8_t* payload = _buffer.data() + _pos;
    size_t valid_up_to = utf8_valid_up_to(payload, length);
    if (valid_up_to != length) {
        _fail(cbor_error::invalid_text(valid_up_to));
    }

    _pos += length;
    return std::string_view{reinterpret_cast<const char*>(payload), length};
}

cbor_len raw_cbor::array() {
    auto [additional_info, length] = _read_argument(cbor_type::array);
    return additional_info == CBOR_INDEFINITE_LENGTH ? cbor_len::indefinite() : cbor_len{length};
}

cbor_len raw_cbor::map() {
    auto [additional_info, length] = _read_argument(cbor_type::map);
    return additional_info == CBOR_INDEFINITE_LENGTH ? cbor_len::indefinite() : cbor_len{length};
}

uint64_t raw_cbor::tag() {
    auto [additional_info, tag] = _read_argument(cbor_type::tag);
    if (additional_info == CBOR_INDEFINITE_LENGTH) {
        _fail(cbor_error::unknown_len_type(additional_info));
    }

    return tag;
}

cbor_special raw_cbor::special() {
    uint8_t initial_byte = _peek_initial_byte();
    cbor_type type = cbor_type_from_initial_byte(initial_byte);
    if (type != cbor_type::special) {
        _fail(cbor_error::expected_type(cbor_type::special, type));
    }

    uint8_t additional_info = initial_byte & 0x1f;

    if (additional_info < CBOR_VALUE_FALSE) {
        _pos += 1;
        return cbor_special::unassigned(additional_info);
    }

    switch (additional_info) {
        case CBOR_VALUE_FALSE:
        case CBOR_VALUE_TRUE:
            _pos += 1;
            return cbor_special::boolean(additional_info == CBOR_VALUE_TRUE);
        case CBOR_VALUE_NULL:
            _pos += 1;
            return cbor_special::null();
        case CBOR_VALUE_UNDEFINED:
            _pos += 1;
            return cbor_special::undefined();
        case CBOR_VALUE_SIMPLE_U8: {
            if (bytes_remaining() < 2) {
                _fail(cbor_error::not_enough(bytes_remaining(), 2));
            }

            uint8_t simple_value = _buffer[_pos + 1];
            if (simple_value < 32) {
                _fail(cbor_error::expected(cbor_expectation::unassigned));
            }

            _pos += 2;
            return cbor_special::unassigned(simple_value);
        }
        case CBOR_VALUE_FLOAT16:
        case CBOR_VALUE_FLOAT32:
        case CBOR_VALUE_FLOAT64:
            _fail(cbor_error::expected(cbor_expectation::floating_point));
        case CBOR_VALUE_BREAK:
            _pos += 1;
            return cbor_special::break_();
        default:
            _fail(cbor_error::unknown_len_type(additional_info));
    }
}

bool raw_cbor::boolean() {
    cbor_special value = special();
    if (!value.is_bool()) {
        _fail(cbor_error::expected(cbor_expectation::boolean));
    }

    return value.bool_value();
}

void raw_cbor::null() {
    if (!special().is_null()) {
        _fail(cbor_error::expected(cbor_expectation::null));
    }
}

void raw_cbor::undefined() {
    if (!special().is_undefined()) {
        _fail(cbor_error::expected(cbor_expectation::undefined));
    }
}

void raw_cbor::break_() {
    if (!special().is_break()) {
        _fail(cbor_error::expected(cbor_expectation::break_));
    }
}

uint8_t raw_cbor::_peek_initial_byte() const {
    if (bytes_remaining() < 1) {
        _fail(cbor_error::not_enough(bytes_remaining(), 1));
    }

    return _buffer[_pos];
}

std::pair<uint8_t, uint64_t> raw_cbor::_read_argument(cbor_type expected_type) {
    uint8_t initial_byte = _peek_initial_byte();
    cbor_type type = cbor_type_from_initial_byte(initial_byte);
    if (type != expected_type) {
        _fail(cbor_error::expected_type(expected_type, type));
    }

    uint8_t additional_info = initial_byte & 0x1f;

    if (additional_info <= CBOR_MAX_INLINE_VALUE) {
        _pos += 1;
        return {additional_info, additional_info};
    }

    if (additional_info == CBOR_INDEFINITE_LENGTH) {
        _pos += 1;
        return {additional_info, 0};
    }

    size_t width = argument_width(additional_info);
    if (width == 0) {
        _fail(cbor_error::unknown_len_type(additional_info));
    }

    if (bytes_remaining() < 1 + width) {
        _fail(cbor_error::not_enough(bytes_remaining(), 1 + width));
    }

    const uint8_t* argument = _buffer.data() + _pos + 1;
    uint64_t value = 0;
    switch (width) {
        case 1: value = be_bytes_to_integer<uint8_t>(argument); break;
        case 2: value = be_bytes_to_integer<uint16_t>(argument); break;
        case 4: value = be_bytes_to_integer<uint32_t>(argument); break;
        case 8: value = be_bytes_to_integer<uint64_t>(argument); break;
    }

    _pos += 1 + width;
    return {additional_info, value};
}

void raw_cbor::_fail(const cbor_error& error) const {
    spdlog::debug("CBOR decoding failed at byte {}: {}", _pos, error.what());
    if (spdlog::should_log(spdlog::level::trace)) {
        log_multiline_binary(_buffer, "    ");
    }

    throw error;
}

}  // namespace cbe
