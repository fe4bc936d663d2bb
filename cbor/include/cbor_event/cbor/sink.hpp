#pragma once

#include <cbor_event/types.hpp>
#include <cbor_event/util.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace cbe {

// An output sink is any type with
//
//     void write_all(byte_span bytes);
//
// that either appends every byte or throws cbor_error(write_error), plus a
// `finalize() &&` that hands back what was written. Sinks are append-only.

// Growable sink backed by a byte_vector; only fails if allocation does.
class vector_sink {
public:
    vector_sink() {}
    explicit vector_sink(byte_vector initial) : _output(std::move(initial)) {}

    NON_COPYABLE(vector_sink);
    MOVABLE(vector_sink);

    void write_all(byte_span bytes) {
        _output.insert(_output.end(), bytes.begin(), bytes.end());
    }

    size_t bytes_written() const { return _output.size(); }
    const byte_vector& vector() const { return _output; }

    byte_vector finalize() && { return std::move(_output); }

private:
    byte_vector _output;
};

// Sink over a caller-owned region with a single write offset. A write that
// does not fit is rejected whole and leaves the region untouched, so the
// sink never allocates.
class fixed_buffer_sink {
public:
    explicit fixed_buffer_sink(mutable_byte_span buffer) : _buffer(buffer) {}

    template <size_t N>
    explicit fixed_buffer_sink(byte_array<N>& buffer)
        : fixed_buffer_sink(mutable_byte_span{buffer.data(), buffer.size()}) {}

    NON_COPYABLE(fixed_buffer_sink);
    MOVABLE(fixed_buffer_sink);

    void write_all(byte_span bytes);

    size_t offset() const { return _offset; }
    size_t capacity() const { return _buffer.size(); }
    size_t bytes_remaining() const { return _buffer.size() - _offset; }

    byte_span written() const { return byte_span{_buffer.data(), _offset}; }

    mutable_byte_span finalize() && { return _buffer.first(_offset); }

private:
    mutable_byte_span _buffer;
    size_t _offset{0};
};

// Sink forwarding to a std::ostream. A stream left in a failed state turns
// into cbor_error(write_error); bytes the stream accepted before failing are
// not recalled.
class ostream_sink {
public:
    explicit ostream_sink(std::ostream& output) : _output(&output) {}

    NON_COPYABLE(ostream_sink);
    MOVABLE(ostream_sink);

    void write_all(byte_span bytes);

    size_t bytes_written() const { return _bytes_written; }

    std::ostream& finalize() && { return *_output; }

private:
    std::ostream* _output;
    size_t _bytes_written{0};
};

}  // namespace cbe
