#pragma once

#include <cbor_event/cbor/detail.hpp>

#include <cstdint>
#include <ostream>

namespace cbe {

// A major type 7 value other than a floating point number.
class cbor_special {
public:
    enum class kind : uint8_t {
        boolean,
        null,
        undefined,
        unassigned,
        break_,
    };

    static constexpr cbor_special boolean(bool value) { return {kind::boolean, value ? uint8_t{1} : uint8_t{0}}; }
    static constexpr cbor_special null() { return {kind::null, 0}; }
    static constexpr cbor_special undefined() { return {kind::undefined, 0}; }
    static constexpr cbor_special unassigned(uint8_t simple_value) { return {kind::unassigned, simple_value}; }
    static constexpr cbor_special break_() { return {kind::break_, 0}; }

    constexpr kind type() const { return _kind; }

    constexpr bool is_bool() const { return _kind == kind::boolean; }
    constexpr bool is_null() const { return _kind == kind::null; }
    constexpr bool is_undefined() const { return _kind == kind::undefined; }
    constexpr bool is_unassigned() const { return _kind == kind::unassigned; }
    constexpr bool is_break() const { return _kind == kind::break_; }

    // Throws cbor_error(expected_bool) unless is_bool()
    bool bool_value() const;

    // Throws cbor_error(expected_unassigned) unless is_unassigned()
    uint8_t unassigned_value() const;

    constexpr bool operator==(const cbor_special& rhs) const {
        return _kind == rhs._kind && _value == rhs._value;
    }

    constexpr bool operator!=(const cbor_special& rhs) const { return !(*this == rhs); }

    constexpr bool operator<(const cbor_special& rhs) const {
        return _kind == rhs._kind ? _value < rhs._value : _kind < rhs._kind;
    }

private:
    constexpr cbor_special(kind k, uint8_t value) : _kind(k), _value(value) {}

    kind _kind;
    uint8_t _value;
};

std::ostream& operator<<(std::ostream& os, const cbor_special& special);

}  // namespace cbe
