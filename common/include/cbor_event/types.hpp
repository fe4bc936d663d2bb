#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cbe {

using byte_vector = std::vector<uint8_t>;
template <size_t N> using byte_array = std::array<uint8_t, N>;

// Read-only view into a caller-owned buffer. The buffer must outlive the view.
using byte_span = std::span<const uint8_t>;
using mutable_byte_span = std::span<uint8_t>;

namespace literals {

inline byte_vector operator "" _bytes(const char* chars, size_t size) {
    auto begin = reinterpret_cast<const uint8_t*>(chars);
    return byte_vector(begin, begin + size);
}

}  // namespace literals

}  // namespace cbe
