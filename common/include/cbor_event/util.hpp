#pragma once

#include <cbor_event/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace cbe {

#define COPYABLE(class_name) \
    class_name(const class_name&) = default; \
    class_name& operator=(const class_name&) = default

#define NON_COPYABLE(class_name) \
    class_name(const class_name&) = delete; \
    class_name& operator=(const class_name&) = delete

#define MOVABLE(class_name) \
    class_name(class_name&&) = default; \
    class_name& operator=(class_name&&) = default

#define NON_MOVABLE(class_name) \
    class_name(class_name&&) = delete; \
    class_name& operator=(class_name&&) = delete

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T, typename U>
constexpr bool is_same_remove_cvref_v = std::is_same_v<remove_cvref_t<T>, remove_cvref_t<U>>;

template <typename T, typename U>
using enable_if_convertible_without_cvref =
    std::enable_if_t<std::is_convertible_v<remove_cvref_t<T>, remove_cvref_t<U>>, int>;

void dump_binary(std::stringstream& ss, const uint8_t* buffer, size_t length, size_t indent = 0);

inline void dump_binary(std::stringstream& ss, byte_span binary, size_t indent = 0) {
    dump_binary(ss, binary.data(), binary.size(), indent);
}

// std::nullopt when the variable is unset
std::optional<std::string> get_environment_variable(const std::string& variable_name);
std::optional<std::string> get_environment_variable(const char* variable_name);

// Entry point for applications embedding the codec: call once at startup,
// before decoding, so the codec's error and hex-dump logging goes somewhere.
// The library never calls it itself and logs through whatever spdlog default
// is installed otherwise.
//
// Installs a stderr logger named `log_name` as the spdlog default. The level
// comes from the CBOR_EVENT_DEBUG environment variable: "trace" for trace,
// any other value for debug, and warn when it is unset.
void set_up_logger(std::string_view log_name);

void log_multiline(const std::string& data, const std::string& indent_str = "");
void log_multiline(std::stringstream& data, const std::string& indent_str = "");
void log_multiline_binary(byte_span buffer, const std::string& indent_str = "");
void log_multiline_binary(const uint8_t* buffer, size_t length, const std::string& indent_str = "");

}  // namespace cbe
