#pragma once

#include <cbor_event/cbor/raw_cbor.hpp>
#include <cbor_event/cbor/serializer.hpp>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace cbe {

// Tag number plus the item it frames. The tag is carried through without
// being interpreted.
template <typename TCborValue>
class basic_cbor_tag {
public:
    explicit basic_cbor_tag(raw_cbor& raw, size_t depth = 0)
        : _tag(raw.tag()), _value(std::make_shared<const TCborValue>(raw, depth + 1)) {}

    basic_cbor_tag(uint64_t tag, TCborValue value)
        : _tag(tag), _value(std::make_shared<const TCborValue>(std::move(value))) {}

    template <typename TSink>
    void dump_cbor_into(basic_serializer<TSink>& serializer) const {
        serializer.write_tag(_tag);
        _value->dump_cbor_into(serializer);
    }

    uint64_t tag() const { return _tag; }
    const TCborValue& value() const { return *_value; }

    bool operator==(const basic_cbor_tag<TCborValue>& rhs) const {
        return _tag == rhs._tag && *_value == *rhs._value;
    }

    bool operator<(const basic_cbor_tag<TCborValue>& rhs) const {
        return _tag == rhs._tag ? *_value < *rhs._value : _tag < rhs._tag;
    }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        ss << _tag << '(';
        _value->dump_debug(ss);
        ss << ')';
    }

private:
    uint64_t _tag;
    std::shared_ptr<const TCborValue> _value;
};

class cbor_value;
using cbor_tag = basic_cbor_tag<cbor_value>;

}  // namespace cbe
