#pragma once

#include <cbor_event/cbor/error.hpp>
#include <cbor_event/cbor/len.hpp>
#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serializer.hpp>
#include <cbor_event/cbor/special.hpp>
#include <cbor_event/cbor/traits_fwd.hpp>
#include <cbor_event/cbor/type.hpp>

#include <cbor_event/format.hpp>
#include <cbor_event/types.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cbe {

// Record types opt in with a member
//
//     template <typename TSink>
//     void dump_cbor_into(basic_serializer<TSink>& serializer) const;
//
// and a constructor `explicit T(raw_cbor& raw)`.
template <typename T, typename Enable>
struct cbor_traits {
    template <typename TSink>
    static void serialize(const T& value, basic_serializer<TSink>& serializer) {
        value.dump_cbor_into(serializer);
    }

    static T deserialize(raw_cbor& raw) { return T{raw}; }
};

template <typename T>
struct cbor_traits<T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>>> {
    template <typename TSink>
    static void serialize(T value, basic_serializer<TSink>& serializer) {
        serializer.write_unsigned_integer(value);
    }

    static T deserialize(raw_cbor& raw) {
        uint64_t value = raw.unsigned_integer();
        if (value > std::numeric_limits<T>::max()) {
            throw cbor_error::expected(narrowing_expectation<T>());
        }

        return static_cast<T>(value);
    }
};

template <typename T>
struct cbor_traits<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>> {
    template <typename TSink>
    static void serialize(T value, basic_serializer<TSink>& serializer) {
        if (value >= 0) {
            serializer.write_unsigned_integer(static_cast<uint64_t>(value));
        } else {
            serializer.write_negative_integer(value);
        }
    }

    static T deserialize(raw_cbor& raw) {
        constexpr auto max = static_cast<uint64_t>(std::numeric_limits<T>::max());

        cbor_type type = raw.peek_type();
        switch (type) {
            case cbor_type::unsigned_integer: {
                uint64_t value = raw.unsigned_integer();
                if (value > max) {
                    throw cbor_error::expected(narrowing_expectation<T>());
                }

                return static_cast<T>(value);
            }
            case cbor_type::negative_integer: {
                // -1 - raw_value >= min  <=>  raw_value <= max
                uint64_t raw_value = raw.negative_integer_raw();
                if (raw_value > max) {
                    throw cbor_error::expected(narrowing_expectation<T>());
                }

                return static_cast<T>(-1 - static_cast<int64_t>(raw_value));
            }
            default:
                throw cbor_error::expected_type(cbor_type::unsigned_integer, type);
        }
    }
};

template <>
struct cbor_traits<bool> {
    template <typename TSink>
    static void serialize(bool value, basic_serializer<TSink>& serializer) {
        serializer.write_bool(value);
    }

    static bool deserialize(raw_cbor& raw) { return raw.boolean(); }
};

template <>
struct cbor_traits<cbor_special> {
    template <typename TSink>
    static void serialize(cbor_special value, basic_serializer<TSink>& serializer) {
        serializer.write_special(value);
    }

    static cbor_special deserialize(raw_cbor& raw) { return raw.special(); }
};

template <>
struct cbor_traits<std::string> {
    template <typename TSink>
    static void serialize(const std::string& value, basic_serializer<TSink>& serializer) {
        serializer.write_text(value);
    }

    static std::string deserialize(raw_cbor& raw) { return std::string{raw.text()}; }
};

template <>
struct cbor_traits<byte_vector> {
    template <typename TSink>
    static void serialize(const byte_vector& value, basic_serializer<TSink>& serializer) {
        serializer.write_bytes(value);
    }

    static byte_vector deserialize(raw_cbor& raw) {
        byte_span bytes = raw.bytes();
        return byte_vector(bytes.begin(), bytes.end());
    }
};

namespace detail {

// Never reserve more elements than there are bytes left, since every element
// takes at least one byte
inline size_t reservation_for(const raw_cbor& raw, const cbor_len& len) {
    if (len.is_indefinite()) {
        return 0;
    }

    return static_cast<size_t>(std::min<uint64_t>(len.length(), raw.bytes_remaining()));
}

}  // namespace detail

// Encoded as a definite-length array. Decoding accepts both definite and
// indefinite arrays.
template <typename T, typename TAllocator>
struct cbor_traits<std::vector<T, TAllocator>, std::enable_if_t<!std::is_same_v<std::vector<T, TAllocator>, byte_vector>>> {
    template <typename TSink>
    static void serialize(const std::vector<T, TAllocator>& value, basic_serializer<TSink>& serializer) {
        serializer.serialize_fixed_array(value);
    }

    static std::vector<T, TAllocator> deserialize(raw_cbor& raw) {
        cbor_len len = raw.array();

        std::vector<T, TAllocator> result;
        result.reserve(detail::reservation_for(raw, len));

        if (len.is_finite()) {
            for (uint64_t i = 0; i < len.length(); i++) {
                result.emplace_back(raw.deserialize<T>());
            }
        } else {
            while (!raw.at_break()) {
                result.emplace_back(raw.deserialize<T>());
            }

            raw.break_();
        }

        return result;
    }
};

// Encoded as a definite-length map in key order. Decoding accepts both
// definite and indefinite maps and rejects duplicate keys.
template <typename TKey, typename TValue, typename TCompare, typename TAllocator>
struct cbor_traits<std::map<TKey, TValue, TCompare, TAllocator>> {
    using map_type = std::map<TKey, TValue, TCompare, TAllocator>;

    template <typename TSink>
    static void serialize(const map_type& value, basic_serializer<TSink>& serializer) {
        serializer.write_map(cbor_len{static_cast<uint64_t>(value.size())});
        for (const auto& [key, item] : value) {
            serializer.serialize(key);
            serializer.serialize(item);
        }
    }

    static map_type deserialize(raw_cbor& raw) {
        cbor_len len = raw.map();

        map_type result;
        if (len.is_finite()) {
            for (uint64_t i = 0; i < len.length(); i++) {
                _read_pair(raw, result);
            }
        } else {
            while (!raw.at_break()) {
                _read_pair(raw, result);
            }

            raw.break_();
        }

        return result;
    }

private:
    static void _read_pair(raw_cbor& raw, map_type& result) {
        size_t key_index = raw.index();
        TKey key = raw.deserialize<TKey>();
        TValue item = raw.deserialize<TValue>();
        if (!result.emplace(std::move(key), std::move(item)).second) {
            throw cbor_error::custom(fmt::format("duplicate map key at byte {}", key_index));
        }
    }
};

template <typename T>
byte_vector dump_cbor(const T& value) {
    serializer s;
    s.serialize(value);
    return std::move(s).finalize();
}

template <typename T>
T parse_cbor(byte_span bytes) {
    raw_cbor raw{bytes};
    return raw.deserialize<T>();
}

// Encodes `value`, decodes the result and reports whether it compares equal.
// Meant for testing cbor_traits implementations.
template <typename T>
bool test_encode_decode(const T& value) {
    byte_vector bytes = dump_cbor(value);
    return parse_cbor<T>(bytes) == value;
}

// Encodes `value` as a standalone document and embeds it as a byte string
template <typename T, typename TSink>
basic_serializer<TSink>& serialize_nested_cbor(const T& value, basic_serializer<TSink>& serializer) {
    byte_vector inner = dump_cbor(value);
    return serializer.serialize_cbor_in_cbor(inner);
}

// Reads a byte string and decodes it as a standalone document holding a T.
// The embedded document must contain nothing after that T.
template <typename T>
T deserialize_nested_cbor(raw_cbor& raw) {
    raw_cbor inner{raw.bytes()};
    T value = inner.deserialize<T>();

    if (inner.bytes_remaining() != 0) {
        throw cbor_error::custom(
            fmt::format("{} trailing bytes after embedded cbor document", inner.bytes_remaining())
        );
    }

    return value;
}

}  // namespace cbe
