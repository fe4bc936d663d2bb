#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

namespace cbe {

// Length of a CBOR aggregate: either a definite element count or the
// indefinite marker. Integers and strings are always finite.
class cbor_len {
public:
    constexpr cbor_len(uint64_t length) : _length(length) {}

    static constexpr cbor_len indefinite() { return cbor_len{}; }

    constexpr bool is_finite() const { return _length.has_value(); }
    constexpr bool is_indefinite() const { return !_length.has_value(); }

    // Throws std::bad_optional_access when indefinite
    constexpr uint64_t length() const { return _length.value(); }

    constexpr bool operator==(const cbor_len& rhs) const { return _length == rhs._length; }
    constexpr bool operator!=(const cbor_len& rhs) const { return !(*this == rhs); }

private:
    constexpr cbor_len() {}

    std::optional<uint64_t> _length;
};

inline std::ostream& operator<<(std::ostream& os, const cbor_len& len) {
    if (len.is_indefinite()) {
        return os << "indefinite";
    }

    return os << "len(" << len.length() << ")";
}

}  // namespace cbe
