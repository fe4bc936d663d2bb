#include "test_helpers.hpp"

#include <cbor_event/cbor.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <type_traits>
#include <utility>
#include <vector>

TEST(CBOR, FixedBufferSink) {
    cbe::byte_array<4> buffer{};
    cbe::fixed_buffer_serializer serializer{cbe::fixed_buffer_sink{buffer}};
    serializer.serialize(std::vector<uint64_t>{0, 1, 2});

    ASSERT_EQ(serializer.sink().offset(), 4);
    ASSERT_EQ(serializer.sink().bytes_remaining(), 0);

    cbe::mutable_byte_span written = std::move(serializer).finalize();
    ASSERT_EQ(written.size(), 4);
    ASSERT_TRUE(written.data() == buffer.data());
    ASSERT_EQ(buffer, (cbe::byte_array<4>{0x83, 0x00, 0x01, 0x02}));
}

TEST(CBOR, FixedBufferSinkOverflow) {
    // An item that does not fit is rejected without touching the buffer
    {
        cbe::byte_array<3> buffer;
        buffer.fill(0xaa);

        cbe::fixed_buffer_serializer serializer{cbe::fixed_buffer_sink{buffer}};
        serializer.write_unsigned_integer(1);

        auto error = catch_cbor_error([&] { serializer.write_unsigned_integer(256); });
        ASSERT_EQ(error.code(), cbe::cbor_error_code::write_error);
        ASSERT_EQ(error.have(), 2);
        ASSERT_EQ(error.want(), 3);

        ASSERT_EQ(serializer.sink().offset(), 1);
        ASSERT_EQ(buffer, (cbe::byte_array<3>{0x01, 0xaa, 0xaa}));
    }

    // Encoding [0, 1, 2] takes 4 bytes
    {
        cbe::byte_array<3> buffer;
        buffer.fill(0xaa);

        cbe::fixed_buffer_sink sink{buffer};
        cbe::fixed_buffer_serializer serializer{std::move(sink)};
        EXPECT_CBOR_ERROR(serializer.serialize(std::vector<uint64_t>{0, 1, 2}), cbe::cbor_error_code::write_error);

        // Items written before the failing one are kept
        ASSERT_EQ(serializer.sink().offset(), 3);
        ASSERT_EQ(buffer, (cbe::byte_array<3>{0x83, 0x00, 0x01}));
    }

    // A byte string's header may fit when its payload doesn't
    {
        std::vector<uint8_t> storage(4, 0xaa);
        cbe::fixed_buffer_serializer serializer{cbe::fixed_buffer_sink{cbe::mutable_byte_span{storage}}};
        EXPECT_CBOR_ERROR(serializer.write_bytes(cbe::byte_vector{1, 2, 3, 4}), cbe::cbor_error_code::write_error);
        ASSERT_EQ(serializer.sink().offset(), 1);
        ASSERT_EQ(storage, (std::vector<uint8_t>{0x44, 0xaa, 0xaa, 0xaa}));
    }

    // Zero capacity
    {
        cbe::fixed_buffer_sink sink{cbe::mutable_byte_span{}};
        auto error = catch_cbor_error([&] { sink.write_all(cbe::byte_vector{0x00}); });
        ASSERT_EQ(error.have(), 0);
        ASSERT_EQ(error.want(), 1);
        ASSERT_EQ(sink.capacity(), 0);
    }
}

TEST(CBOR, VectorSink) {
    cbe::serializer serializer;
    serializer.write_text("a").write_null();
    ASSERT_EQ(serializer.sink().bytes_written(), 3);
    ASSERT_EQ(serializer.sink().vector(), (cbe::byte_vector{0x61, 'a', 0xf6}));

    // Appends to existing contents
    cbe::serializer appending{cbe::vector_sink{cbe::byte_vector{0x82}}};
    appending.write_unsigned_integer(1).write_unsigned_integer(2);
    ASSERT_EQ(std::move(appending).finalize(), (cbe::byte_vector{0x82, 0x01, 0x02}));
}

TEST(CBOR, OstreamSink) {
    {
        std::ostringstream stream;
        cbe::ostream_serializer serializer{cbe::ostream_sink{stream}};
        serializer.write_array(2).write_unsigned_integer(500).write_text("hi");
        ASSERT_EQ(serializer.sink().bytes_written(), 7);

        static_assert(std::is_same_v<decltype(std::move(serializer).finalize()), std::ostream&>);
        static_assert(std::is_same_v<decltype(std::declval<cbe::serializer>().finalize()), cbe::byte_vector>);

        std::ostream& output = std::move(serializer).finalize();
        ASSERT_EQ(&output, &stream);
        ASSERT_EQ(stream.str(), std::string("\x82\x19\x01\xf4\x62hi", 7));
    }

    {
        std::ostringstream stream;
        stream.setstate(std::ios::badbit);
        cbe::ostream_serializer serializer{cbe::ostream_sink{stream}};
        EXPECT_CBOR_ERROR(serializer.write_unsigned_integer(1), cbe::cbor_error_code::write_error);
        ASSERT_EQ(serializer.sink().bytes_written(), 0);
    }
}
