#pragma once

#include <cbor_event/cbor/detail.hpp>
#include <cbor_event/cbor/error.hpp>
#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serializer.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>

namespace cbe {

namespace detail {

template <typename T>
constexpr bool can_fit_in_cbor_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) <= sizeof(uint64_t);

}  // namespace detail

// Integer of either sign covering the whole CBOR range, from -2^64 to
// 2^64 - 1. Negative values are stored as their raw argument.
class cbor_integer {
public:
    explicit cbor_integer(raw_cbor& raw) {
        cbor_type type = raw.peek_type();
        switch (type) {
            case cbor_type::unsigned_integer:
                _type = CBOR_NON_NEGATIVE_INTEGER;
                _raw_value = raw.unsigned_integer();
                break;
            case cbor_type::negative_integer:
                _type = CBOR_NEGATIVE_INTEGER;
                _raw_value = raw.negative_integer_raw();
                break;
            default:
                throw cbor_error::expected_type(cbor_type::unsigned_integer, type);
        }
    }

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    constexpr cbor_integer(T value) {
        if (value >= 0) {
            _type = CBOR_NON_NEGATIVE_INTEGER;
            _raw_value = static_cast<uint64_t>(value);
        } else {
            _type = CBOR_NEGATIVE_INTEGER;
            _raw_value = static_cast<uint64_t>(-1 - static_cast<int64_t>(value));
        }
    }

    static constexpr cbor_integer from_negative_raw(uint64_t raw_value) {
        cbor_integer result{0};
        result._type = CBOR_NEGATIVE_INTEGER;
        result._raw_value = raw_value;
        return result;
    }

    template <typename TSink>
    void dump_cbor_into(basic_serializer<TSink>& serializer) const {
        if (_type == CBOR_NEGATIVE_INTEGER) {
            serializer.write_negative_integer_raw(_raw_value);
        } else {
            serializer.write_unsigned_integer(_raw_value);
        }
    }

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    constexpr operator T() const {
        constexpr auto max = static_cast<uint64_t>(std::numeric_limits<T>::max());

        if (_type == CBOR_NEGATIVE_INTEGER) {
            if (std::is_unsigned_v<T> || _raw_value > max) {
                throw cbor_error::expected(narrowing_expectation<T>());
            }

            return static_cast<T>(-1 - static_cast<int64_t>(_raw_value));
        }

        if (_raw_value > max) {
            throw cbor_error::expected(narrowing_expectation<T>());
        }

        return static_cast<T>(_raw_value);
    }

    constexpr bool is_negative() const { return _type == CBOR_NEGATIVE_INTEGER; }
    constexpr uint64_t raw_value() const { return _raw_value; }

    cbor_type type() const {
        return is_negative() ? cbor_type::negative_integer : cbor_type::unsigned_integer;
    }

    // Negative values order before non-negative ones; among negative values a
    // larger raw value is a smaller number
    bool operator<(const cbor_integer& rhs) const {
        if (_type != rhs._type) {
            return _type > rhs._type;
        }

        return is_negative() ? _raw_value > rhs._raw_value : _raw_value < rhs._raw_value;
    }

    bool operator==(const cbor_integer& rhs) const { return _type == rhs._type && _raw_value == rhs._raw_value; }
    bool operator!=(const cbor_integer& rhs) const { return !(*this == rhs); }
    bool operator>(const cbor_integer& rhs) const { return rhs < *this; }
    bool operator>=(const cbor_integer& rhs) const { return !(*this < rhs); }
    bool operator<=(const cbor_integer& rhs) const { return !(rhs < *this); }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        if (is_negative()) {
            // -1 - raw_value would overflow int64_t for the smallest values, so
            // print the magnitude instead. raw_value + 1 can itself overflow at
            // the very bottom of the range.
            if (_raw_value == std::numeric_limits<uint64_t>::max()) {
                ss << "-18446744073709551616";
            } else {
                ss << '-' << _raw_value + 1;
            }
        } else {
            ss << _raw_value;
        }
    }

private:
    uint8_t _type{CBOR_NON_NEGATIVE_INTEGER};
    uint64_t _raw_value{0};
};

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator==(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) == rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator!=(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) != rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator<(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) < rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator>(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) > rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator<=(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) <= rhs; }

template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
bool operator>=(T lhs, const cbor_integer& rhs) { return cbor_integer(lhs) >= rhs; }

}  // namespace cbe
