#include <gtest/gtest.h>
#include <waypoint/common/error.hpp>
#include <waypoint/schema/primitives.hpp>

#include <string>

TEST(primitives, make_hash32_from_bytes_copies_input) {
  auto input = waypoint::schema::bytes_t(32, 0xAB);
  auto hash = waypoint::schema::make_hash32(waypoint::schema::bytes_view_t{input});
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_rejects_wrong_length) {
  auto input = waypoint::schema::bytes_t(31, 0x00);
  EXPECT_THROW(
      waypoint::schema::make_hash32(waypoint::schema::bytes_view_t{input}),
      waypoint::common::error);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = waypoint::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_address_accepts_mixed_case_without_prefix) {
  auto address = waypoint::schema::make_address(
      std::string_view{"F39Fd6e51aad88F6F4ce6aB8827279cffFb92266"});
  EXPECT_EQ(address[0], 0xF3);
  EXPECT_EQ(address[19], 0x66);
  EXPECT_FALSE(waypoint::schema::try_make_address("0x1234").has_value());
  EXPECT_FALSE(waypoint::schema::try_make_address(
                   "0xg39fd6e51aad88f6f4ce6ab8827279cfffb92266")
                   .has_value());
}

TEST(primitives, hex_round_trips_and_rejects_odd_length) {
  auto bytes = waypoint::schema::from_hex("0x00ff10");
  EXPECT_EQ(bytes, (waypoint::schema::bytes_t{0x00, 0xFF, 0x10}));
  EXPECT_EQ(waypoint::schema::to_hex_prefixed(bytes), "0x00ff10");
  EXPECT_TRUE(waypoint::schema::from_hex("0x").empty());
  EXPECT_FALSE(waypoint::schema::try_from_hex("0x123").has_value());
  EXPECT_THROW(waypoint::schema::from_hex("zz"), waypoint::common::error);
}

TEST(primitives, hex_accepts_mixed_case_and_writes_lowercase) {
  auto bytes = waypoint::schema::from_hex("0XaBcD");
  EXPECT_EQ(bytes, (waypoint::schema::bytes_t{0xAB, 0xCD}));
  EXPECT_EQ(waypoint::schema::to_hex(bytes), "abcd");
  EXPECT_FALSE(waypoint::schema::try_from_hex("0x0g").has_value());
  EXPECT_FALSE(waypoint::schema::try_make_address("0x" + std::string(39, 'a'))
                   .has_value());
}

TEST(primitives, parse_uint256_accepts_decimal_and_hex) {
  EXPECT_EQ(*waypoint::schema::try_parse_uint256("0"), 0);
  EXPECT_EQ(*waypoint::schema::try_parse_uint256("123420001114"),
            waypoint::schema::uint256_t{123420001114ull});
  EXPECT_EQ(*waypoint::schema::try_parse_uint256("0xff"), 255);
  EXPECT_EQ(*waypoint::schema::try_parse_uint256("0XFF"), 255);
}

TEST(primitives, parse_uint256_reads_leading_zeros_as_decimal) {
  EXPECT_EQ(*waypoint::schema::try_parse_uint256("010"), 10);
  EXPECT_EQ(*waypoint::schema::try_parse_uint256("000"), 0);
  EXPECT_EQ(*waypoint::schema::try_parse_uint256("0x0010"), 16);
  EXPECT_FALSE(waypoint::schema::try_parse_uint256("0xfg").has_value());
}

TEST(primitives, parse_uint256_rejects_signs_garbage_and_overflow) {
  EXPECT_FALSE(waypoint::schema::try_parse_uint256("").has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256("-1").has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256("+1").has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256(" 1").has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256("12a").has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256("0x").has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256("1.5").has_value());

  // 2^256 - 1 fits, 2^256 does not.
  auto max = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639935"};
  auto over = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639936"};
  EXPECT_TRUE(waypoint::schema::try_parse_uint256(max).has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256(over).has_value());
  EXPECT_FALSE(waypoint::schema::try_parse_uint256(
                   "0x1" + std::string(64, '0'))
                   .has_value());
}

TEST(primitives, to_word_left_pads_big_endian) {
  auto word = waypoint::schema::to_word(waypoint::schema::uint256_t{0x0102});
  EXPECT_EQ(word[29], 0x00);
  EXPECT_EQ(word[30], 0x01);
  EXPECT_EQ(word[31], 0x02);
  EXPECT_EQ(waypoint::schema::from_big_endian(
                waypoint::schema::bytes_view_t{word}),
            0x0102);
}

TEST(primitives, minimal_bytes_strip_leading_zeros) {
  EXPECT_TRUE(waypoint::schema::to_minimal_bytes(0).empty());
  EXPECT_EQ(waypoint::schema::to_minimal_bytes(1024),
            (waypoint::schema::bytes_t{0x04, 0x00}));
}

TEST(primitives, quantities_render_as_compact_hex_and_decimal) {
  EXPECT_EQ(waypoint::schema::to_quantity(0), "0x0");
  EXPECT_EQ(waypoint::schema::to_quantity(1), "0x1");
  EXPECT_EQ(waypoint::schema::to_quantity(4096), "0x1000");
  EXPECT_EQ(waypoint::schema::to_decimal(
                waypoint::schema::uint256_t{123420001114ull}),
            "123420001114");
}
