#include "test_helpers.hpp"

#include <cbor_event/cbor.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

template <typename T, typename = void>
struct can_write_unsigned_integer : std::false_type {};

template <typename T>
struct can_write_unsigned_integer<
    T,
    std::void_t<decltype(std::declval<cbe::serializer&>().write_unsigned_integer(std::declval<T>()))>
> : std::true_type {};

}  // namespace

TEST(CBOR, Specials) {
    ASSERT_EQ(encode_with([](auto& s) { s.write_bool(false); }), (cbe::byte_vector{0xf4}));
    ASSERT_EQ(encode_with([](auto& s) { s.write_bool(true); }), (cbe::byte_vector{0xf5}));
    ASSERT_EQ(encode_with([](auto& s) { s.write_null(); }), (cbe::byte_vector{0xf6}));
    ASSERT_EQ(encode_with([](auto& s) { s.write_undefined(); }), (cbe::byte_vector{0xf7}));
    ASSERT_EQ(encode_with([](auto& s) { s.write_break(); }), (cbe::byte_vector{0xff}));
    ASSERT_EQ(encode_with([](auto& s) { s.write_special(cbe::cbor_special::unassigned(16)); }), (cbe::byte_vector{0xf0}));
    ASSERT_EQ(encode_with([](auto& s) { s.write_special(cbe::cbor_special::unassigned(255)); }), (cbe::byte_vector{0xf8, 0xff}));

    {
        cbe::byte_vector bytes{0xf4, 0xf5, 0xf6, 0xf7, 0xf0, 0xf8, 0x20, 0xff};
        cbe::raw_cbor raw{bytes};
        ASSERT_EQ(raw.special(), cbe::cbor_special::boolean(false));
        ASSERT_EQ(raw.special(), cbe::cbor_special::boolean(true));
        ASSERT_EQ(raw.special(), cbe::cbor_special::null());
        ASSERT_EQ(raw.special(), cbe::cbor_special::undefined());
        ASSERT_EQ(raw.special(), cbe::cbor_special::unassigned(16));
        ASSERT_EQ(raw.special(), cbe::cbor_special::unassigned(32));
        ASSERT_TRUE(raw.at_break());
        ASSERT_EQ(raw.special(), cbe::cbor_special::break_());
        ASSERT_EQ(raw.bytes_remaining(), 0);
    }

    {
        cbe::byte_vector bytes{0xf5, 0xf6, 0xf7, 0xff};
        cbe::raw_cbor raw{bytes};
        ASSERT_TRUE(raw.boolean());
        raw.null();
        raw.undefined();
        raw.break_();
        ASSERT_EQ(raw.bytes_remaining(), 0);
    }

    ASSERT_TRUE(cbe::parse_cbor<bool>(cbe::dump_cbor(true)));
    ASSERT_FALSE(cbe::parse_cbor<bool>(cbe::dump_cbor(false)));
    ASSERT_TRUE(cbe::test_encode_decode(cbe::cbor_special::undefined()));
}

TEST(CBOR, SpecialAccessors) {
    auto value = cbe::cbor_special::boolean(true);
    ASSERT_TRUE(value.is_bool());
    ASSERT_TRUE(value.bool_value());
    EXPECT_CBOR_ERROR(value.unassigned_value(), cbe::cbor_error_code::expected_unassigned);

    auto simple = cbe::cbor_special::unassigned(100);
    ASSERT_TRUE(simple.is_unassigned());
    ASSERT_EQ(simple.unassigned_value(), 100);
    EXPECT_CBOR_ERROR(simple.bool_value(), cbe::cbor_error_code::expected_bool);

    ASSERT_LT(cbe::cbor_special::boolean(false), cbe::cbor_special::boolean(true));
    ASSERT_NE(cbe::cbor_special::null(), cbe::cbor_special::undefined());
}

TEST(CBOR, SpecialErrors) {
    // Checked reads on the wrong special value
    {
        cbe::byte_vector bytes{0xf6};
        cbe::raw_cbor raw{bytes};
        EXPECT_CBOR_ERROR(raw.boolean(), cbe::cbor_error_code::expected_bool);
    }

    {
        cbe::byte_vector bytes{0xf5};
        cbe::raw_cbor raw{bytes};
        EXPECT_CBOR_ERROR(raw.null(), cbe::cbor_error_code::expected_null);
    }

    {
        cbe::byte_vector bytes{0xf6};
        cbe::raw_cbor raw{bytes};
        EXPECT_CBOR_ERROR(raw.undefined(), cbe::cbor_error_code::expected_undefined);
    }

    {
        cbe::byte_vector bytes{0xf6};
        cbe::raw_cbor raw{bytes};
        EXPECT_CBOR_ERROR(raw.break_(), cbe::cbor_error_code::expected_break);
    }

    {
        cbe::byte_vector bytes{0x01};
        cbe::raw_cbor raw{bytes};
        EXPECT_CBOR_ERROR(raw.boolean(), cbe::cbor_error_code::expected_type);
    }

    // Floating point values are recognised but not decoded
    for (auto bytes : {cbe::byte_vector{0xf9, 0x3c, 0x00},
                       cbe::byte_vector{0xfa, 0x47, 0xc3, 0x50, 0x00},
                       cbe::byte_vector{0xfb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a}}) {
        {
            cbe::raw_cbor raw{bytes};
            ASSERT_EQ(raw.peek_type(), cbe::cbor_type::special);
            EXPECT_CBOR_ERROR(raw.special(), cbe::cbor_error_code::expected_float);
        }

        {
            cbe::raw_cbor raw{bytes};
            EXPECT_CBOR_ERROR(raw.boolean(), cbe::cbor_error_code::expected_float);
        }
    }

    // Two byte form below 32 is not well-formed
    EXPECT_CBOR_ERROR(cbe::parse_cbor<cbe::cbor_special>(cbe::byte_vector{0xf8, 0x10}), cbe::cbor_error_code::expected_unassigned);
    EXPECT_CBOR_ERROR(cbe::parse_cbor<cbe::cbor_special>(cbe::byte_vector{0xf8}), cbe::cbor_error_code::not_enough);

    // Reserved
    for (uint8_t byte : {0xfc, 0xfd, 0xfe}) {
        cbe::byte_vector bytes{byte};
        auto error = catch_cbor_error([&] { cbe::parse_cbor<cbe::cbor_special>(bytes); });
        ASSERT_EQ(error.code(), cbe::cbor_error_code::unknown_len_type);
        ASSERT_EQ(error.additional_info(), byte & 0x1f);
    }

    // Simple values 20-31 have dedicated encodings or are reserved
    {
        cbe::serializer serializer;
        EXPECT_CBOR_ERROR(serializer.write_special(cbe::cbor_special::unassigned(24)), cbe::cbor_error_code::expected_unassigned);
        EXPECT_CBOR_ERROR(serializer.write_special(cbe::cbor_special::unassigned(20)), cbe::cbor_error_code::expected_unassigned);
        ASSERT_EQ(serializer.sink().bytes_written(), 0);
    }
}

TEST(CBOR, PeekType) {
    std::vector<std::pair<cbe::byte_vector, cbe::cbor_type>> cases = {
        {{0x00}, cbe::cbor_type::unsigned_integer},
        {{0x20}, cbe::cbor_type::negative_integer},
        {{0x40}, cbe::cbor_type::bytes},
        {{0x60}, cbe::cbor_type::text},
        {{0x80}, cbe::cbor_type::array},
        {{0xa0}, cbe::cbor_type::map},
        {{0xc0, 0x00}, cbe::cbor_type::tag},
        {{0xf6}, cbe::cbor_type::special},
    };

    for (auto&& [bytes, expected_type] : cases) {
        cbe::raw_cbor raw{bytes};
        ASSERT_EQ(raw.peek_type(), expected_type);
        ASSERT_EQ(raw.index(), 0);
    }

    cbe::byte_vector empty;
    cbe::raw_cbor raw{empty};
    auto error = catch_cbor_error([&] { raw.peek_type(); });
    ASSERT_EQ(error.code(), cbe::cbor_error_code::not_enough);
    ASSERT_EQ(error.have(), 0);
    ASSERT_EQ(error.want(), 1);
    EXPECT_CBOR_ERROR(raw.at_break(), cbe::cbor_error_code::not_enough);
}

TEST(CBOR, FloatingPointIsNotAnInteger) {
    static_assert(can_write_unsigned_integer<uint32_t>::value);
    static_assert(can_write_unsigned_integer<uint64_t>::value);
    static_assert(!can_write_unsigned_integer<float>::value);
    static_assert(!can_write_unsigned_integer<double>::value);
}
