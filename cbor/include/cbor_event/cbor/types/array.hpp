#pragma once

#include <cbor_event/cbor/detail.hpp>
#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serializer.hpp>

#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace cbe {

class cbor_value;

class cbor_array {
public:
    cbor_array() {}

    explicit cbor_array(raw_cbor& raw, size_t depth = 0);
    explicit cbor_array(const std::vector<cbor_value>& vec);
    cbor_array(std::initializer_list<cbor_value> list);

    const cbor_value& operator[](size_t index) const { return _array[index]; }

    void push_back(cbor_value val);

    size_t size() const { return _array.size(); }

    // Whether the array is framed with a break marker instead of a count.
    // Decoding records the framing it saw; encoding reproduces it.
    bool is_indefinite() const { return _indefinite; }
    void set_indefinite(bool indefinite) { _indefinite = indefinite; }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    // Defined in value.hpp, once cbor_value is complete
    template <typename TSink>
    void dump_cbor_into(basic_serializer<TSink>& serializer) const;

    const std::vector<cbor_value>& vector() const { return _array; }
    operator const std::vector<cbor_value>&() const { return vector(); }

    template <typename T>
    explicit operator std::vector<T>() const;

    bool operator==(const cbor_array& rhs) const;
    bool operator<(const cbor_array& rhs) const;

private:
    std::vector<cbor_value> _array;
    bool _indefinite{false};
};

}  // namespace cbe
