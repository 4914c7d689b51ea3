#include <gtest/gtest.h>
#include <chronicle/schema/primitives.hpp>

#include <algorithm>

TEST(primitives, try_make_hash32_requires_exactly_32_bytes) {
  auto input = chronicle::schema::bytes_t(32, 0xAB);
  auto hash = chronicle::schema::try_make_hash32(input);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ(hash.value()[0], 0xAB);
  EXPECT_EQ(hash.value()[31], 0xAB);

  auto short_input = chronicle::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(chronicle::schema::try_make_hash32(short_input).has_value());
}

TEST(primitives, try_parse_hash32_accepts_prefix_and_either_case) {
  auto hash = chronicle::schema::try_parse_hash32(
      "0x0102030405060708090A0B0C0D0E0F10"
      "1112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ(hash.value()[0], 0x01);
  EXPECT_EQ(hash.value()[9], 0x0a);
  EXPECT_EQ(hash.value()[31], 0x20);
}

TEST(primitives, try_parse_hash32_rejects_bad_input) {
  EXPECT_FALSE(chronicle::schema::try_parse_hash32("abcd").has_value());
  EXPECT_FALSE(chronicle::schema::try_parse_hash32(
                   "zz02030405060708090a0b0c0d0e0f10"
                   "1112131415161718191a1b1c1d1e1f20")
                   .has_value());
  EXPECT_FALSE(chronicle::schema::try_parse_hash32(
                   "0102030405060708090a0b0c0d0e0f10"
                   "1112131415161718191a1b1c1d1e1f2021")
                   .has_value());
}

TEST(primitives, to_hex_is_lowercase_and_parses_back) {
  auto bytes = chronicle::schema::bytes_t(32, 0x00);
  bytes[1] = 0x0F;
  bytes[2] = 0xA0;
  bytes[31] = 0xFF;
  auto hex = chronicle::schema::to_hex(bytes);
  EXPECT_EQ(hex.substr(0, 6), "000fa0");
  EXPECT_EQ(hex.substr(62), "ff");
  auto parsed = chronicle::schema::try_parse_hash32(hex);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(std::equal(parsed->begin(), parsed->end(), bytes.begin()));
}
