#pragma once

#include <cbor_event/cbor/detail.hpp>
#include <cbor_event/cbor/error.hpp>
#include <cbor_event/cbor/len.hpp>
#include <cbor_event/cbor/sink.hpp>
#include <cbor_event/cbor/special.hpp>
#include <cbor_event/cbor/traits_fwd.hpp>
#include <cbor_event/cbor/type.hpp>

#include <cbor_event/format.hpp>
#include <cbor_event/types.hpp>
#include <cbor_event/util.hpp>

#include <cstdint>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <utility>

namespace cbe {

// Sequential CBOR writer. Every write_* call appends exactly one complete
// item (or, for write_array/write_map/write_tag, the header of one) to the
// sink in canonical form, and returns *this so calls can be chained.
//
// Errors are thrown as cbor_error. Nothing is rolled back: when a call fails
// partway through an aggregate, the items written before it stay in the sink.
template <typename TSink>
class basic_serializer {
public:
    using sink_type = TSink;

    basic_serializer() {}
    explicit basic_serializer(TSink sink) : _sink(std::move(sink)) {}

    NON_COPYABLE(basic_serializer);
    MOVABLE(basic_serializer);

    basic_serializer& write_unsigned_integer(uint64_t value) {
        _write_header(CBOR_NON_NEGATIVE_INTEGER, value);
        return *this;
    }

    // Writes `value`, which must be negative, as major type 1 with argument
    // -1 - value.
    basic_serializer& write_negative_integer(int64_t value) {
        if (value >= 0) {
            throw cbor_error::custom(
                fmt::format("cannot encode non-negative value {} as a negative integer", value)
            );
        }

        return write_negative_integer_raw(static_cast<uint64_t>(-1 - value));
    }

    // Writes major type 1 with `raw_value` as the argument, i.e. the integer
    // -1 - raw_value. Covers the negative range that int64_t can't hold.
    basic_serializer& write_negative_integer_raw(uint64_t raw_value) {
        _write_header(CBOR_NEGATIVE_INTEGER, raw_value);
        return *this;
    }

    // Floating point values are not supported; reject them instead of letting
    // them convert to an integer.
    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    basic_serializer& write_unsigned_integer(T value) = delete;

    template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    basic_serializer& write_negative_integer(T value) = delete;

    basic_serializer& write_bytes(byte_span bytes) {
        _write_header(CBOR_BYTE_STRING, bytes.size());
        _sink.write_all(bytes);
        return *this;
    }

    basic_serializer& write_text(std::string_view text) {
        _write_header(CBOR_TEXT_STRING, text.size());
        _sink.write_all(byte_span{reinterpret_cast<const uint8_t*>(text.data()), text.size()});
        return *this;
    }

    // Writes only the header; the caller writes the elements next, followed by
    // write_break() when `len` is indefinite.
    basic_serializer& write_array(cbor_len len) {
        _write_aggregate_header(CBOR_ARRAY, len);
        return *this;
    }

    // As write_array, with `len` counting key/value pairs.
    basic_serializer& write_map(cbor_len len) {
        _write_aggregate_header(CBOR_MAP, len);
        return *this;
    }

    // The tagged item must be written by the next call.
    basic_serializer& write_tag(uint64_t tag) {
        _write_header(CBOR_TAG, tag);
        return *this;
    }

    basic_serializer& write_special(cbor_special special) {
        switch (special.type()) {
            case cbor_special::kind::boolean:
                _write_initial_byte(CBOR_EVERYTHING_ELSE, special.bool_value() ? CBOR_VALUE_TRUE : CBOR_VALUE_FALSE);
                break;
            case cbor_special::kind::null:
                _write_initial_byte(CBOR_EVERYTHING_ELSE, CBOR_VALUE_NULL);
                break;
            case cbor_special::kind::undefined:
                _write_initial_byte(CBOR_EVERYTHING_ELSE, CBOR_VALUE_UNDEFINED);
                break;
            case cbor_special::kind::unassigned: {
                uint8_t simple_value = special.unassigned_value();
                if (simple_value < CBOR_VALUE_FALSE) {
                    _write_initial_byte(CBOR_EVERYTHING_ELSE, simple_value);
                } else if (simple_value < 32) {
                    // 20-23 are bool/null/undefined and 24-31 are not valid
                    // simple values
                    throw cbor_error::expected(cbor_expectation::unassigned);
                } else {
                    uint8_t bytes[] = {make_initial_byte(CBOR_EVERYTHING_ELSE, CBOR_VALUE_SIMPLE_U8), simple_value};
                    _sink.write_all(byte_span{bytes, sizeof(bytes)});
                }
                break;
            }
            case cbor_special::kind::break_:
                _write_initial_byte(CBOR_EVERYTHING_ELSE, CBOR_VALUE_BREAK);
                break;
        }

        return *this;
    }

    basic_serializer& write_bool(bool value) { return write_special(cbor_special::boolean(value)); }
    basic_serializer& write_null() { return write_special(cbor_special::null()); }
    basic_serializer& write_undefined() { return write_special(cbor_special::undefined()); }
    basic_serializer& write_break() { return write_special(cbor_special::break_()); }

    template <typename T>
    basic_serializer& serialize(const T& value) {
        cbor_traits<T>::serialize(value, *this);
        return *this;
    }

    // Writes a definite-length array sized to `items`, then each element.
    // Stops at the first element that fails.
    template <typename TRange>
    basic_serializer& serialize_fixed_array(const TRange& items) {
        write_array(cbor_len{static_cast<uint64_t>(std::size(items))});
        for (const auto& item : items) {
            serialize(item);
        }

        return *this;
    }

    // Embeds an already encoded CBOR document as a byte string. Decode it with
    // raw_cbor::bytes() and a second raw_cbor over the returned span.
    basic_serializer& serialize_cbor_in_cbor(byte_span encoded_cbor) {
        return write_bytes(encoded_cbor);
    }

    const TSink& sink() const { return _sink; }

    // Whatever the sink hands back: the bytes for vector_sink, the written
    // prefix for fixed_buffer_sink, the stream itself for ostream_sink
    decltype(auto) finalize() && { return std::move(_sink).finalize(); }

private:
    TSink _sink;

    void _write_initial_byte(uint8_t major_type, uint8_t additional_info) {
        uint8_t initial_byte = make_initial_byte(major_type, additional_info);
        _sink.write_all(byte_span{&initial_byte, 1});
    }

    void _write_header(uint8_t major_type, uint64_t raw_value) {
        uint8_t header[CBOR_MAX_HEADER_SIZE];
        size_t header_size = encode_header_into(header, major_type, raw_value);
        _sink.write_all(byte_span{header, header_size});
    }

    void _write_aggregate_header(uint8_t major_type, cbor_len len) {
        if (len.is_indefinite()) {
            _write_initial_byte(major_type, CBOR_INDEFINITE_LENGTH);
        } else {
            _write_header(major_type, len.length());
        }
    }
};

using serializer = basic_serializer<vector_sink>;
using fixed_buffer_serializer = basic_serializer<fixed_buffer_sink>;
using ostream_serializer = basic_serializer<ostream_sink>;

}  // namespace cbe
