#include <guardrail/schema/audit_entry.hpp>
#include <guardrail/schema/compliance_record.hpp>
#include <guardrail/schema/encoding/scale/encoder.hpp>
#include <gtest/gtest.h>

#include <tuple>

namespace {

using encoder_t = guardrail::schema::encoding::scale_encoder_t;

guardrail::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = guardrail::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

guardrail::schema::compliance_record_t make_record() {
  return guardrail::schema::compliance_record_t{
      .account = "3player",
      .age_verified = true,
      .daily_limit = 100,
      .monthly_limit = 1000,
      .daily_spent = 60,
      .monthly_spent = 260,
      .last_reset_day = 1'699'920'000'000,
      .last_reset_month = 1'697'760'000'000,
      .cooldown_until = 1'700'003'600'000,
      .self_excluded_until = std::nullopt,
      .platforms_used = {"casino-2", "casino-1"},
      .registered_at = 1'699'000'000'000,
      .audit_sequence = 7,
      .audit_root = make_hash(3)};
}

}  // namespace

TEST(encoding_types, compliance_record_decodes_to_equal_value) {
  auto encoder = encoder_t{};
  auto record = make_record();
  auto encoded = encoder.encode(record);
  auto decoded =
      encoder.decode<guardrail::schema::compliance_record_t>(encoded);
  EXPECT_EQ(decoded, record);
  EXPECT_EQ(decoded.platforms_used.size(), 2u);
  EXPECT_FALSE(decoded.self_excluded_until.has_value());
  ASSERT_TRUE(decoded.cooldown_until.has_value());
}

TEST(encoding_types, platform_order_does_not_change_encoding) {
  auto encoder = encoder_t{};
  auto first = make_record();
  auto second = make_record();
  second.platforms_used.clear();
  second.platforms_used.insert("casino-1");
  second.platforms_used.insert("casino-2");
  EXPECT_EQ(encoder.encode(first), encoder.encode(second));
}

TEST(encoding_types, audit_entry_decodes_to_equal_value) {
  auto encoder = encoder_t{};
  auto entry = guardrail::schema::audit_entry_t{
      .sequence = 4,
      .timestamp = 1'700'000'000'000,
      .operation = guardrail::schema::operation_type_t::record_transaction,
      .amount = 60,
      .platform_id = "casino-1",
      .previous_root = make_hash(1),
      .root = make_hash(2)};
  auto decoded =
      encoder.decode<guardrail::schema::audit_entry_t>(encoder.encode(entry));
  EXPECT_EQ(decoded, entry);
}

TEST(encoding_types, truncated_bytes_fail_try_decode) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_record());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(
      encoder.try_decode<guardrail::schema::compliance_record_t>(encoded)
          .has_value());
}

TEST(encoding_types, encode_appends_to_existing_buffer) {
  auto encoder = encoder_t{};
  auto out = guardrail::schema::bytes_t{0xff};
  encoder.encode(std::tuple{uint64_t{1}, uint8_t{2}}, out);
  EXPECT_EQ(out.size(), 1u + 8u + 1u);
  EXPECT_EQ(out.front(), 0xff);
}
