#include "test_helpers.hpp"

#include <cbor_event/cbor.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace cbe::literals;

TEST(CBOR, ValueBoxing) {
    // cbor_text_string
    {
        std::string str_obj = "hello world";

        cbe::cbor_text_string original_cbor_str{"hello world"};
        ASSERT_EQ(original_cbor_str, "hello world");
        ASSERT_EQ(original_cbor_str, str_obj);

        cbe::cbor_value boxed_cbor_str{original_cbor_str};
        ASSERT_EQ(boxed_cbor_str, original_cbor_str);
        ASSERT_TRUE(boxed_cbor_str.holds<cbe::cbor_text_string>());
        ASSERT_EQ(boxed_cbor_str.type(), cbe::cbor_type::text);

        auto unboxed_cbor_str = static_cast<cbe::cbor_text_string>(boxed_cbor_str);
        ASSERT_EQ(unboxed_cbor_str, "hello world");
        ASSERT_EQ(unboxed_cbor_str, str_obj);
        ASSERT_EQ(static_cast<std::string>(boxed_cbor_str), str_obj);
    }

    // cbor_integer
    {
        cbe::cbor_value boxed{-5};
        ASSERT_EQ(boxed.type(), cbe::cbor_type::negative_integer);
        ASSERT_EQ(boxed.get<int32_t>(), -5);
        EXPECT_CBOR_ERROR(boxed.get<uint32_t>(), cbe::cbor_error_code::expected_u32);
    }

    // Default is null
    {
        cbe::cbor_value value;
        ASSERT_EQ(value, cbe::cbor_value{cbe::cbor_special::null()});
        ASSERT_EQ(value.type(), cbe::cbor_type::special);
        ASSERT_EQ(value.dump_debug(), "null");
    }
}

TEST(CBOR, ValueCasting) {
    cbe::cbor_text_string str{"hello world"};
    ASSERT_EQ(str, "hello world");

    cbe::cbor_value boxed_str{str};
    EXPECT_CBOR_ERROR(static_cast<cbe::cbor_integer>(boxed_str), cbe::cbor_error_code::custom);
    EXPECT_CBOR_ERROR(static_cast<cbe::cbor_array>(boxed_str), cbe::cbor_error_code::custom);
    EXPECT_CBOR_ERROR(static_cast<cbe::cbor_map>(boxed_str), cbe::cbor_error_code::custom);
    EXPECT_THROW(static_cast<cbe::cbor_byte_string>(boxed_str), std::runtime_error);
}

TEST(CBOR, ValueParsing) {
    // {"a": 1, "b": [2, 3]}
    cbe::byte_vector bytes{0xa2, 0x61, 'a', 0x01, 0x61, 'b', 0x82, 0x02, 0x03};

    auto value = cbe::parse_cbor<cbe::cbor_value>(bytes);
    ASSERT_EQ(value.type(), cbe::cbor_type::map);
    ASSERT_EQ(value.dump_debug(), "{\"a\": 1, \"b\": [2, 3]}");
    ASSERT_EQ(cbe::dump_cbor(value), bytes);

    auto map = value.get<cbe::cbor_map>();
    ASSERT_EQ(map.at<cbe::cbor_array>("b").size(), 2);
}

TEST(CBOR, ValueRoundtrip) {
    cbe::cbor_value original{cbe::cbor_array{
        0,
        -1,
        "text",
        cbe::cbor_byte_string{"\x01\x02"_bytes},
        cbe::cbor_map{{1, "one"}, {"two", 2}},
        cbe::cbor_tag{1, 1363896240},
        cbe::cbor_special::boolean(true),
        cbe::cbor_special::undefined(),
        cbe::cbor_special::unassigned(100),
        cbe::cbor_value{},
    }};

    cbe::byte_vector bytes = cbe::dump_cbor(original);
    auto parsed = cbe::parse_cbor<cbe::cbor_value>(bytes);
    ASSERT_EQ(parsed, original);
    ASSERT_EQ(cbe::dump_cbor(parsed), bytes);
    ASSERT_EQ(
        parsed.dump_debug(),
        "[0, -1, \"text\", b\"0102\", {1: \"one\", \"two\": 2}, 1(1363896240), true, undefined, simple(100), null]"
    );
}

TEST(CBOR, ValueIndefiniteFraming) {
    // [_ 1, [_ ], {_ "a": 2}]
    cbe::byte_vector bytes{0x9f, 0x01, 0x9f, 0xff, 0xbf, 0x61, 'a', 0x02, 0xff, 0xff};

    auto value = cbe::parse_cbor<cbe::cbor_value>(bytes);
    ASSERT_EQ(value.dump_debug(), "[1, [], {\"a\": 2}]");
    ASSERT_EQ(cbe::dump_cbor(value), bytes);
}

TEST(CBOR, ValueFullIntegerRange) {
    cbe::byte_vector bytes{0x3b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff};

    auto value = cbe::parse_cbor<cbe::cbor_value>(bytes);
    ASSERT_EQ(value.dump_debug(), "-18446744073709551616");
    ASSERT_EQ(cbe::dump_cbor(value), bytes);
    EXPECT_CBOR_ERROR(value.get<int64_t>(), cbe::cbor_error_code::expected_i64);
}

TEST(CBOR, ValueDepthLimit) {
    auto nested_arrays = [](size_t depth) {
        cbe::byte_vector bytes(depth, 0x81);
        bytes.push_back(0x00);
        return bytes;
    };

    {
        cbe::byte_vector bytes = nested_arrays(cbe::CBOR_MAX_VALUE_DEPTH);
        auto value = cbe::parse_cbor<cbe::cbor_value>(bytes);
        ASSERT_EQ(cbe::dump_cbor(value), bytes);
    }

    {
        cbe::byte_vector bytes = nested_arrays(cbe::CBOR_MAX_VALUE_DEPTH + 1);
        auto error = catch_cbor_error([&] { cbe::parse_cbor<cbe::cbor_value>(bytes); });
        ASSERT_EQ(error.code(), cbe::cbor_error_code::depth_limit_exceeded);
    }

    // Tags count towards the depth too
    {
        cbe::byte_vector bytes(10000, 0xc1);
        bytes.push_back(0x00);
        EXPECT_CBOR_ERROR(cbe::parse_cbor<cbe::cbor_value>(bytes), cbe::cbor_error_code::depth_limit_exceeded);
    }
}

TEST(CBOR, ValueErrors) {
    EXPECT_CBOR_ERROR(cbe::parse_cbor<cbe::cbor_value>(cbe::byte_vector{0xff}), cbe::cbor_error_code::custom);
    EXPECT_CBOR_ERROR(cbe::parse_cbor<cbe::cbor_value>(cbe::byte_vector{0xf9, 0x00, 0x00}), cbe::cbor_error_code::expected_float);
    EXPECT_CBOR_ERROR(cbe::parse_cbor<cbe::cbor_value>(cbe::byte_vector{0x5f, 0xff}), cbe::cbor_error_code::indefinite_len_not_supported);
    EXPECT_CBOR_ERROR(cbe::parse_cbor<cbe::cbor_value>(cbe::byte_vector{}), cbe::cbor_error_code::not_enough);
}
