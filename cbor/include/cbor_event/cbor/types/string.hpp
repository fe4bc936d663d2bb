#pragma once

#include <cbor_event/cbor/detail.hpp>
#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serializer.hpp>

#include <cbor_event/format.hpp>
#include <cbor_event/types.hpp>
#include <cbor_event/util.hpp>

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace cbe {

namespace detail {

template <typename TString>
struct basic_cbor_string_type;

template <typename TString>
inline constexpr cbor_type basic_cbor_string_type_v = basic_cbor_string_type<TString>::value;

template <> struct basic_cbor_string_type<byte_vector> { static constexpr cbor_type value = cbor_type::bytes; };
template <> struct basic_cbor_string_type<std::string> { static constexpr cbor_type value = cbor_type::text; };

}  // namespace detail

// Owning byte or text string. Decoding copies out of the input buffer.
template <typename TString>
class basic_cbor_string {
public:
    using string_type = TString;
    using value_type = typename string_type::value_type;

    static constexpr bool is_binary = detail::basic_cbor_string_type_v<TString> == cbor_type::bytes;

    explicit basic_cbor_string(raw_cbor& raw) {
        if constexpr (is_binary) {
            byte_span bytes = raw.bytes();
            _str.assign(bytes.begin(), bytes.end());
        } else {
            _str = raw.text();
        }
    }

    basic_cbor_string(string_type str) : _str(std::move(str)) {}

    template <typename T = TString, std::enable_if_t<std::is_same_v<T, std::string>, int> = 0>
    basic_cbor_string(const char* str) : _str(str) {}

    basic_cbor_string() {}

    template <typename TSink>
    void dump_cbor_into(basic_serializer<TSink>& serializer) const {
        if constexpr (is_binary) {
            serializer.write_bytes(_str);
        } else {
            serializer.write_text(_str);
        }
    }

    const string_type& string() const { return _str; }

    const value_type* data() const { return _str.data(); }
    size_t size() const { return _str.size(); }

    operator const string_type&() const { return _str; }

    bool operator==(const basic_cbor_string<TString>& rhs) const { return _str == rhs._str; }
    bool operator<(const basic_cbor_string<TString>& rhs) const { return _str < rhs._str; }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        if constexpr (is_binary) {
            ss << 'b';
        }

        ss << '"';

        for (auto c : _str) {
            if constexpr (is_binary) {
                ss << fmt::format("{:02x}", c);
            } else {
                if (c == '"') {
                    ss << '\\';
                }

                ss << c;
            }
        }

        ss << '"';
    }

private:
    TString _str;
};

using cbor_byte_string = basic_cbor_string<byte_vector>;
using cbor_text_string = basic_cbor_string<std::string>;

}  // namespace cbe
