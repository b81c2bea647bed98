#include <stowage/schema/error_code.hpp>
#include <stowage/schema/primitives.hpp>
#include <stowage/schema/status.hpp>
#include <gtest/gtest.h>

#include <string>

TEST(primitives, hex_round_trips_and_accepts_prefix) {
  auto bytes = stowage::schema::bytes_t{0x00, 0x7f, 0xab, 0xff};
  auto hex = stowage::schema::to_hex(stowage::schema::make_bytes_view(bytes));
  EXPECT_EQ(hex, "007fabff");

  auto decoded = stowage::schema::try_from_hex("0x007FABff");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);
}

TEST(primitives, from_hex_rejects_malformed_input) {
  EXPECT_FALSE(stowage::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(stowage::schema::try_from_hex("zz").has_value());
  auto empty = stowage::schema::try_from_hex("");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(primitives, hash32_requires_exactly_32_bytes) {
  auto short_bytes = stowage::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(stowage::schema::try_make_hash32(
                   stowage::schema::make_bytes_view(short_bytes))
                   .has_value());

  auto exact = stowage::schema::bytes_t(32, 0x02);
  auto hash =
      stowage::schema::try_make_hash32(stowage::schema::make_bytes_view(exact));
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[31], 0x02);

  auto from_hex = stowage::schema::try_make_hash32(
      std::string_view{std::string(64, 'f')});
  ASSERT_TRUE(from_hex.has_value());
  EXPECT_EQ((*from_hex)[0], 0xff);
  EXPECT_FALSE(stowage::schema::try_make_hash32(std::string_view{"ff"})
                   .has_value());
}

TEST(primitives, string_and_byte_views_share_content) {
  auto text = std::string{"stowage"};
  auto bytes = stowage::schema::make_bytes(text);
  EXPECT_EQ(stowage::schema::make_string(bytes), text);
  EXPECT_EQ(stowage::schema::make_string_view(bytes), text);
  EXPECT_EQ(stowage::schema::make_bytes_view(text).size(), text.size());
}

TEST(primitives, zero_hash_is_all_zero) {
  for (const auto byte : stowage::schema::make_zero_hash()) {
    EXPECT_EQ(byte, 0);
  }
}

TEST(status, defaults_to_ok_and_names_errors) {
  auto ok = stowage::schema::make_ok();
  EXPECT_TRUE(stowage::schema::is_ok(ok));
  EXPECT_EQ(ok.version, 1);

  auto error = stowage::schema::make_error(
      stowage::schema::error_code::assignment, "not assigned");
  EXPECT_FALSE(stowage::schema::is_ok(error));
  EXPECT_EQ(error.log, "not assigned");
  EXPECT_EQ(stowage::schema::error_code_name(error.code), "assignment_error");
  EXPECT_EQ(stowage::schema::error_code_name(
                stowage::schema::error_code::blob_index_out_of_range),
            "blob_index_out_of_range");
  EXPECT_EQ(
      stowage::schema::error_code_name(stowage::schema::error_code::signing),
      "signing_error");
}
