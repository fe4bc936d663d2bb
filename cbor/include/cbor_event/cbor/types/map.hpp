#pragma once

#include <cbor_event/cbor/detail.hpp>
#include <cbor_event/cbor/error.hpp>
#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serializer.hpp>

#include <cbor_event/format.hpp>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace cbe {

constexpr bool is_cbor_map_key_type(cbor_type type) {
    return type == cbor_type::unsigned_integer ||
           type == cbor_type::negative_integer ||
           type == cbor_type::bytes ||
           type == cbor_type::text;
}

// Map whose keys are integers, byte strings or text strings.
template <typename TCborValue>
class basic_cbor_map {
public:
    basic_cbor_map() {}

    basic_cbor_map(std::initializer_list<std::pair<TCborValue, TCborValue>> list)
        : _map(list.begin(), list.end()) {}

    explicit basic_cbor_map(raw_cbor& raw, size_t depth = 0) {
        cbor_len len = raw.map();
        _indefinite = len.is_indefinite();

        if (len.is_finite()) {
            for (uint64_t i = 0; i < len.length(); i++) {
                _read_pair(raw, depth);
            }
        } else {
            while (!raw.at_break()) {
                _read_pair(raw, depth);
            }

            raw.break_();
        }
    }

    template <typename TSink>
    void dump_cbor_into(basic_serializer<TSink>& serializer) const {
        serializer.write_map(
            _indefinite ? cbor_len::indefinite() : cbor_len{static_cast<uint64_t>(_map.size())}
        );

        for (auto&& pair : _map) {
            if (!is_cbor_map_key_type(pair.first.type())) {
                throw cbor_error::unsupported_key_type(pair.first.type());
            }

            pair.first.dump_cbor_into(serializer);
            pair.second.dump_cbor_into(serializer);
        }

        if (_indefinite) {
            serializer.write_break();
        }
    }

    const std::map<TCborValue, TCborValue>& map() const { return _map; }
    operator const std::map<TCborValue, TCborValue>&() const { return map(); }

    template <typename TKey, typename TValue>
    explicit operator std::map<TKey, TValue>() const {
        std::map<TKey, TValue> result;
        for (auto&& pair : _map) {
            result.emplace(static_cast<TKey>(pair.first), static_cast<TValue>(pair.second));
        }

        return result;
    }

    size_t size() const { return _map.size(); }

    bool is_indefinite() const { return _indefinite; }
    void set_indefinite(bool indefinite) { _indefinite = indefinite; }

    template <typename TKey>
    TCborValue& operator[](TKey&& key) { return _map[TCborValue{std::forward<TKey>(key)}]; }

    template <typename TValue, typename TKey>
    TValue at(TKey&& key) const {
        return static_cast<TValue>(_map.at(TCborValue{std::forward<TKey>(key)}));
    }

    template <typename TValue = TCborValue, typename TKey = TCborValue>
    std::optional<TValue> try_at(TKey&& key) const {
        auto it = _map.find(TCborValue{std::forward<TKey>(key)});
        return it == _map.cend()
            ? std::optional<TValue>{}
            : std::optional<TValue>{static_cast<TValue>(it->second)};
    }

    std::vector<TCborValue> keys() const {
        std::vector<TCborValue> keys;
        for (const auto& item : _map) {
            keys.push_back(item.first);
        }

        return keys;
    }

    bool operator==(const basic_cbor_map<TCborValue>& rhs) const { return _map == rhs._map; }
    bool operator<(const basic_cbor_map<TCborValue>& rhs) const { return _map < rhs._map; }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        ss << '{';

        bool first = true;
        for (auto&& pair : _map) {
            if (!first) {
                ss << ", ";
            }

            pair.first.dump_debug(ss);
            ss << ": ";
            pair.second.dump_debug(ss);

            first = false;
        }

        ss << '}';
    }

private:
    std::map<TCborValue, TCborValue> _map;
    bool _indefinite{false};

    void _read_pair(raw_cbor& raw, size_t depth) {
        size_t key_index = raw.index();

        cbor_type key_type = raw.peek_type();
        if (!is_cbor_map_key_type(key_type)) {
            throw cbor_error::unsupported_key_type(key_type);
        }

        TCborValue key{raw, depth + 1};
        TCborValue value{raw, depth + 1};

        if (!_map.emplace(std::move(key), std::move(value)).second) {
            throw cbor_error::custom(fmt::format("duplicate map key at byte {}", key_index));
        }
    }
};

class cbor_value;
using cbor_map = basic_cbor_map<cbor_value>;

}  // namespace cbe
