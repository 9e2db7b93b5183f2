#include <gtest/gtest.h>
#include <vigil/schema/call_type.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/queue_error_code.hpp>

#include <limits>
#include <string>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = vigil::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_width) {
  EXPECT_FALSE(vigil::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(vigil::schema::try_make_hash32(std::string(66, 'f')).has_value());
  EXPECT_FALSE(vigil::schema::try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_TRUE(vigil::schema::try_make_hash32(std::string(64, 'F')).has_value());
}

TEST(primitives, hex_encodes_lowercase_and_decodes_either_case) {
  auto payload = vigil::schema::bytes_t{0x00, 0x7F, 0x80, 0xFF};
  auto encoded = vigil::schema::to_hex(vigil::schema::make_bytes_view(payload));
  EXPECT_EQ(encoded, "007f80ff");
  EXPECT_EQ(vigil::schema::try_from_hex("0x007F80fF").value(), payload);
  EXPECT_TRUE(vigil::schema::try_from_hex("").value().empty());
  EXPECT_FALSE(vigil::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(vigil::schema::try_from_hex("zz").has_value());
}

TEST(primitives, amount_big_endian_places_low_byte_last) {
  auto bytes = vigil::schema::to_big_endian(vigil::schema::amount_t{0x0102});
  EXPECT_EQ(bytes[30], 0x01);
  EXPECT_EQ(bytes[31], 0x02);
  EXPECT_EQ(bytes[0], 0x00);

  auto max = std::numeric_limits<vigil::schema::amount_t>::max();
  auto max_bytes = vigil::schema::to_big_endian(max);
  for (auto byte : max_bytes) {
    EXPECT_EQ(byte, 0xFF);
  }
  EXPECT_EQ(vigil::schema::from_big_endian(max_bytes), max);
}

TEST(primitives, try_parse_amount_accepts_only_uint256_decimals) {
  EXPECT_EQ(vigil::schema::try_parse_amount("0").value(),
            vigil::schema::amount_t{0});
  EXPECT_EQ(vigil::schema::try_parse_amount("1000000000000000000").value(),
            vigil::schema::amount_t{1000000000000000000ull});

  auto max = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935"};
  EXPECT_TRUE(vigil::schema::try_parse_amount(max).has_value());
  max.back() = '6';
  EXPECT_FALSE(vigil::schema::try_parse_amount(max).has_value());

  EXPECT_FALSE(vigil::schema::try_parse_amount("").has_value());
  EXPECT_FALSE(vigil::schema::try_parse_amount("-1").has_value());
  EXPECT_FALSE(vigil::schema::try_parse_amount("12a").has_value());
}

TEST(primitives, reserved_identities_are_distinct) {
  auto null = vigil::schema::make_null_identity();
  auto sentinel = vigil::schema::make_sentinel_identity();
  EXPECT_TRUE(vigil::schema::is_null_identity(null));
  EXPECT_FALSE(vigil::schema::is_sentinel_identity(null));
  EXPECT_TRUE(vigil::schema::is_sentinel_identity(sentinel));
  EXPECT_FALSE(vigil::schema::is_null_identity(sentinel));
  EXPECT_EQ(vigil::schema::to_hex(sentinel), std::string(62, '0') + "01");
}

TEST(primitives, enum_strings_map_both_ways) {
  EXPECT_EQ(vigil::schema::to_string(vigil::schema::call_type_t::delegate_call),
            "delegate_call");
  EXPECT_EQ(
      vigil::schema::try_from_string<vigil::schema::call_type_t>("call")
          .value(),
      vigil::schema::call_type_t::call);
  EXPECT_FALSE(
      vigil::schema::try_from_string<vigil::schema::call_type_t>("static")
          .has_value());

  EXPECT_EQ(vigil::schema::to_string(
                vigil::schema::queue_error_code::still_in_cooldown),
            "still_in_cooldown");
  EXPECT_EQ(vigil::schema::try_from_string<vigil::schema::queue_error_code>(
                "invalid_target")
                .value(),
            vigil::schema::queue_error_code::invalid_target);
  EXPECT_EQ(static_cast<uint32_t>(vigil::schema::queue_error_code::invalid_target),
            17u);
}
