#pragma once

#include <cbor_event/cbor/error.hpp>
#include <cbor_event/cbor/len.hpp>
#include <cbor_event/cbor/special.hpp>
#include <cbor_event/cbor/traits_fwd.hpp>
#include <cbor_event/cbor/type.hpp>

#include <cbor_event/types.hpp>
#include <cbor_event/util.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

namespace cbe {

// Cursor over a caller-owned CBOR buffer. Each read validates one item's
// header, checks that the item fits in what is left of the buffer, and only
// then consumes it.
//
// The buffer is borrowed: it must not be modified or released while the
// raw_cbor, or any span/string_view returned by bytes() and text(), is in use.
//
// On success the cursor sits at the start of the next item. After a
// cbor_error the position is unspecified and the cursor should be discarded.
class raw_cbor {
public:
    explicit raw_cbor(byte_span buffer) : _buffer(buffer) {}

    // A temporary would be destroyed while the cursor still points into it
    explicit raw_cbor(byte_vector&&) = delete;

    NON_COPYABLE(raw_cbor);
    MOVABLE(raw_cbor);

    size_t index() const { return _pos; }
    size_t bytes_remaining() const { return _buffer.size() - _pos; }
    byte_span remaining() const { return _buffer.subspan(_pos); }

    // Major type of the next item, without consuming anything
    cbor_type peek_type() const;

    // Whether the next byte is the break marker closing an indefinite
    // array or map. Does not consume it; call break_() for that.
    bool at_break() const;

    uint64_t unsigned_integer();

    // Throws cbor_error(expected_i64) when the value is below INT64_MIN
    int64_t negative_integer();

    // The raw argument n of a negative integer, whose value is -1 - n
    uint64_t negative_integer_raw();

    // Returned span aliases the input buffer
    byte_span bytes();

    // Returned view aliases the input buffer and is valid UTF-8
    std::string_view text();

    // Reads only the header. For a finite length the caller then reads that
    // many elements (pairs for map()); for an indefinite one it reads until
    // at_break() and then calls break_().
    cbor_len array();
    cbor_len map();

    // Reads only the tag number; the tagged item follows
    uint64_t tag();

    cbor_special special();
    bool boolean();
    void null();
    void undefined();
    void break_();

    template <typename T>
    T deserialize() {
        return cbor_traits<T>::deserialize(*this);
    }

private:
    byte_span _buffer;
    size_t _pos{0};

    uint8_t _peek_initial_byte() const;
    std::pair<uint8_t, uint64_t> _read_argument(cbor_type expected_type);

    [[noreturn]] void _fail(const cbor_error& error) const;
};

}  // namespace cbe
