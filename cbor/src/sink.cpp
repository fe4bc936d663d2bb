#include "cbor_event/cbor/sink.hpp"

#include "cbor_event/cbor/error.hpp"

#include <cbor_event/format.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cbe {

void fixed_buffer_sink::write_all(byte_span bytes) {
    if (bytes.size() > bytes_remaining()) {
        spdlog::debug(
            "Rejecting {} byte write into fixed buffer ({} of {} bytes used)",
            bytes.size(), _offset, _buffer.size()
        );
        throw cbor_error::write_error(bytes_remaining(), bytes.size());
    }

    std::copy(bytes.begin(), bytes.end(), _buffer.begin() + static_cast<std::ptrdiff_t>(_offset));
    _offset += bytes.size();
}

void ostream_sink::write_all(byte_span bytes) {
    _output->write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!*_output) {
        spdlog::debug("Output stream failed after {} bytes", _bytes_written);
        throw cbor_error::write_error(0, bytes.size());
    }

    _bytes_written += bytes.size();
}

}  // namespace cbe
