#pragma once

#include <cbor_event/cbor/types/array.hpp>
#include <cbor_event/cbor/types/integer.hpp>
#include <cbor_event/cbor/types/map.hpp>
#include <cbor_event/cbor/types/string.hpp>
#include <cbor_event/cbor/types/tag.hpp>

#include <cbor_event/cbor/error.hpp>
#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serializer.hpp>
#include <cbor_event/cbor/special.hpp>

#include <cbor_event/format.hpp>
#include <cbor_event/util.hpp>

#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace cbe {

// Based on https://stackoverflow.com/a/45898325
template <typename T, typename... VariantTypes>
struct is_convertible_to_variant_alternative_type;

template <typename T, typename... VariantTypes>
struct is_convertible_to_variant_alternative_type<T, std::variant<VariantTypes...>> {
    static constexpr bool value = (std::is_convertible_v<remove_cvref_t<T>, remove_cvref_t<VariantTypes>> || ...);
};

template <typename T, typename... VariantTypes>
inline constexpr bool is_convertible_to_variant_alternative_type_v =
    is_convertible_to_variant_alternative_type<T, VariantTypes...>::value;

// Generic decoded CBOR item. Building one is never required to decode; it is
// for callers that don't know the schema up front.
class cbor_value {
public:
    using storage_type = std::variant<
        cbor_integer,
        cbor_byte_string,
        cbor_text_string,
        cbor_array,
        cbor_map,
        cbor_tag,
        cbor_special
    >;

    cbor_value() : _storage(cbor_special::null()) {}

    // Decodes one complete item. Throws cbor_error(depth_limit_exceeded) when
    // aggregates and tags nest deeper than CBOR_MAX_VALUE_DEPTH.
    explicit cbor_value(raw_cbor& raw, size_t depth = 0);

    template <typename T, std::enable_if_t<is_convertible_to_variant_alternative_type_v<T, storage_type>, int> = 0>
    cbor_value(T&& value) : _storage(std::forward<T>(value)) {}

    COPYABLE(cbor_value);
    MOVABLE(cbor_value);

    template <typename TSink>
    void dump_cbor_into(basic_serializer<TSink>& serializer) const {
        std::visit([&](const auto& value) {
            if constexpr (std::is_same_v<remove_cvref_t<decltype(value)>, cbor_special>) {
                serializer.write_special(value);
            } else {
                value.dump_cbor_into(serializer);
            }
        }, _storage);
    }

    // Converts the held alternative to T, throwing cbor_error(custom) when it
    // has no conversion to T
    template <typename T>
    T get() const {
        return std::visit([&](const auto& value) -> T {
            if constexpr (std::is_constructible_v<T, const remove_cvref_t<decltype(value)>&>) {
                return T(value);
            } else {
                throw cbor_error::custom(fmt::format("bad type cast from cbor value of type `{}'", to_string(type())));
            }
        }, _storage);
    }

    template <typename T>
    bool holds() const { return std::holds_alternative<T>(_storage); }

    const storage_type& storage() const { return _storage; }

    cbor_type type() const;

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    template <typename T> explicit operator T() const { return get<T>(); }

    bool operator==(const cbor_value& rhs) const;
    bool operator<(const cbor_value& rhs) const;

private:
    storage_type _storage;
};

template <typename TSink>
void cbor_array::dump_cbor_into(basic_serializer<TSink>& serializer) const {
    serializer.write_array(
        _indefinite ? cbor_len::indefinite() : cbor_len{static_cast<uint64_t>(_array.size())}
    );

    for (auto&& value : _array) {
        value.dump_cbor_into(serializer);
    }

    if (_indefinite) {
        serializer.write_break();
    }
}

template <typename T>
cbor_array::operator std::vector<T>() const {
    std::vector<T> result;
    result.reserve(_array.size());
    for (auto&& value : _array) {
        result.push_back(value.get<T>());
    }

    return result;
}

}  // namespace cbe
