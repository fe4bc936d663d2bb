#include "cbor_event/cbor/detail.hpp"

#include <cbor_event/binary_io.hpp>

#include <limits>

namespace cbe {

size_t encode_header_into(uint8_t* out, uint8_t major_type, uint64_t raw_value) {
    if (raw_value <= CBOR_MAX_INLINE_VALUE) {
        out[0] = make_initial_byte(major_type, static_cast<uint8_t>(raw_value));
        return 1;
    } else if (raw_value <= std::numeric_limits<uint8_t>::max()) {
        out[0] = make_initial_byte(major_type, CBOR_PAYLOAD_LENGTH_U8);
        integer_to_be_bytes_into(out + 1, static_cast<uint8_t>(raw_value));
        return 2;
    } else if (raw_value <= std::numeric_limits<uint16_t>::max()) {
        out[0] = make_initial_byte(major_type, CBOR_PAYLOAD_LENGTH_U16);
        integer_to_be_bytes_into(out + 1, static_cast<uint16_t>(raw_value));
        return 3;
    } else if (raw_value <= std::numeric_limits<uint32_t>::max()) {
        out[0] = make_initial_byte(major_type, CBOR_PAYLOAD_LENGTH_U32);
        integer_to_be_bytes_into(out + 1, static_cast<uint32_t>(raw_value));
        return 5;
    }

    out[0] = make_initial_byte(major_type, CBOR_PAYLOAD_LENGTH_U64);
    integer_to_be_bytes_into(out + 1, raw_value);
    return 9;
}

size_t utf8_valid_up_to(const uint8_t* buffer, size_t length) {
    size_t i = 0;

    while (i < length) {
        uint8_t lead = buffer[i];

        size_t sequence_length;
        uint8_t second_min = 0x80;
        uint8_t second_max = 0xbf;

        if (lead < 0x80) {
            i++;
            continue;
        } else if (lead >= 0xc2 && lead <= 0xdf) {
            sequence_length = 2;
        } else if (lead >= 0xe0 && lead <= 0xef) {
            sequence_length = 3;
            // Reject overlong encodings and UTF-16 surrogates
            if (lead == 0xe0) {
                second_min = 0xa0;
            } else if (lead == 0xed) {
                second_max = 0x9f;
            }
        } else if (lead >= 0xf0 && lead <= 0xf4) {
            sequence_length = 4;
            // Reject overlong encodings and code points above U+10FFFF
            if (lead == 0xf0) {
                second_min = 0x90;
            } else if (lead == 0xf4) {
                second_max = 0x8f;
            }
        } else {
            return i;
        }

        if (length - i < sequence_length) {
            return i;
        }

        if (buffer[i + 1] < second_min || buffer[i + 1] > second_max) {
            return i;
        }

        for (size_t continuation = 2; continuation < sequence_length; continuation++) {
            if ((buffer[i + continuation] & 0xc0) != 0x80) {
                return i;
            }
        }

        i += sequence_length;
    }

    return length;
}

}  // namespace cbe
