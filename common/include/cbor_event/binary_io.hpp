#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace cbe {

template <typename T, size_t N = sizeof(T), std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr void integer_to_be_bytes_into(uint8_t* buffer, T value) {
    using unsigned_type = std::make_unsigned_t<T>;
    auto bits = static_cast<unsigned_type>(value);

    for (size_t byte_i = 0; byte_i < N; byte_i++) {
        buffer[N - byte_i - 1] = static_cast<uint8_t>(bits >> (byte_i * 8));
    }
}

template <typename T, size_t ArrayN, size_t IntegerN = sizeof(T),
          std::enable_if_t<std::is_integral_v<T> && ArrayN >= IntegerN, int> = 0>
constexpr void integer_to_be_bytes_into(std::array<uint8_t, ArrayN>& buffer, T value) {
    integer_to_be_bytes_into<T, IntegerN>(buffer.data(), value);
}

// The caller must have checked that `buffer` holds at least N bytes.
template <typename T, size_t N = sizeof(T), std::enable_if_t<std::is_integral_v<T>, int> = 0>
constexpr T be_bytes_to_integer(const uint8_t* buffer) {
    using unsigned_type = std::make_unsigned_t<T>;
    unsigned_type value = 0;

    for (size_t byte_i = 0; byte_i < N; byte_i++) {
        value = static_cast<unsigned_type>((value << 8) | buffer[byte_i]);
    }

    return static_cast<T>(value);
}

template <typename T, size_t ArrayN, size_t IntegerN = sizeof(T),
          std::enable_if_t<std::is_integral_v<T> && ArrayN >= IntegerN, int> = 0>
constexpr T be_bytes_to_integer(const std::array<uint8_t, ArrayN>& buffer) {
    return be_bytes_to_integer<T, IntegerN>(buffer.data());
}

}  // namespace cbe
