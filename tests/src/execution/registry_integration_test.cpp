#include <guardrail/crypto/verify.hpp>
#include <guardrail/execution/time_window.hpp>
#include <guardrail/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using guardrail::schema::eligibility_status_t;
using guardrail::schema::registry_error_code;

uint32_t code_of(const registry_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace

TEST(registry_integration, limits_then_self_exclusion_across_platforms) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_scenario_a"};
  auto& registry = fixture.registry();

  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());

  auto first = registry.record_transaction("3alice", 60, "casino-1");
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.info, "daily_spent=60 monthly_spent=60");

  auto second = registry.record_transaction("3alice", 60, "casino-2");
  EXPECT_EQ(second.code, code_of(registry_error_code::daily_limit_reached));
  EXPECT_EQ(second.codespace, guardrail::schema::kPolicyCodespace);

  auto record = registry.get_account("3alice");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->daily_spent, 60u);
  EXPECT_EQ(record->monthly_spent, 60u);
  EXPECT_EQ(record->platforms_used,
            (std::set<std::string>{"casino-1"}));

  ASSERT_TRUE(registry.self_exclude("3alice", 30).ok());
  auto check = registry.check_eligibility("3alice", 1);
  EXPECT_EQ(check.status, eligibility_status_t::self_excluded);
  ASSERT_TRUE(check.blocked_until.has_value());
  EXPECT_EQ(*check.blocked_until,
            fixture.now() + 30 * guardrail::schema::kMillisecondsPerDay);
}

TEST(registry_integration, signature_for_another_account_is_rejected) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_scenario_b"};
  auto& registry = fixture.registry();

  auto signature_for_carol = fixture.sign("3carol");
  auto result = registry.register_user(
      "3bob", guardrail::schema::bytes_view_t{signature_for_carol});
  EXPECT_EQ(result.code, code_of(registry_error_code::invalid_signature));
  EXPECT_EQ(result.codespace, guardrail::schema::kConsistencyCodespace);
  EXPECT_FALSE(registry.get_account("3bob").has_value());
  EXPECT_EQ(registry.check_eligibility("3bob", 1).status,
            eligibility_status_t::not_registered);
}

TEST(registry_integration, signature_from_unknown_attestor_is_rejected) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_foreign_key"};
  auto foreign = guardrail::crypto::generate_ed25519_keypair();
  ASSERT_TRUE(foreign.has_value());

  auto message = guardrail::crypto::make_attestation_message("3bob");
  auto signature =
      guardrail::crypto::sign_ed25519(message, foreign->private_key);
  ASSERT_TRUE(signature.has_value());
  auto result = fixture.registry().register_user(
      "3bob", guardrail::schema::bytes_view_t{*signature});
  EXPECT_EQ(result.code, code_of(registry_error_code::invalid_signature));
}

TEST(registry_integration, second_registration_is_rejected) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_reregister"};
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(fixture.registry().set_limits("3alice", 100, 1000).ok());

  auto again = fixture.register_account("3alice");
  EXPECT_EQ(again.code, code_of(registry_error_code::already_registered));

  auto record = fixture.registry().get_account("3alice");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->daily_limit, 100u);
}

TEST(registry_integration, new_record_is_verified_with_no_allowance) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_new_record"};
  ASSERT_TRUE(fixture.register_account("3alice").ok());

  auto record = fixture.registry().get_account("3alice");
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(record->age_verified);
  EXPECT_EQ(record->daily_limit, 0u);
  EXPECT_EQ(record->monthly_limit, 0u);
  EXPECT_EQ(record->registered_at, fixture.now());
  EXPECT_EQ(record->last_reset_day,
            guardrail::execution::bucket_start(
                fixture.now(), guardrail::execution::kDayWindow));
  EXPECT_TRUE(record->platforms_used.empty());

  auto check = fixture.registry().check_eligibility("3alice", 1);
  EXPECT_EQ(check.status, eligibility_status_t::daily_limit_reached);
}

TEST(registry_integration, network_prefix_is_stripped_before_verification) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_prefix"};

  // The attestor signs the identifier without its leading '3'.
  auto raw = guardrail::schema::make_bytes(std::string{"alice"});
  auto signature =
      guardrail::crypto::sign_ed25519(raw, fixture.keypair().private_key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(fixture.registry()
                  .register_user("3alice",
                                 guardrail::schema::bytes_view_t{*signature})
                  .ok());
}

TEST(registry_integration, prefix_can_be_disabled) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_no_prefix",
                                                      std::nullopt};
  auto raw = guardrail::schema::make_bytes(std::string{"alice"});
  auto stripped =
      guardrail::crypto::sign_ed25519(raw, fixture.keypair().private_key);
  ASSERT_TRUE(stripped.has_value());
  EXPECT_EQ(fixture.registry()
                .register_user("3alice",
                               guardrail::schema::bytes_view_t{*stripped})
                .code,
            code_of(registry_error_code::invalid_signature));
  EXPECT_TRUE(fixture.register_account("3alice").ok());
}

TEST(registry_integration, hex_signature_overload_checks_length) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_hex_sig"};
  auto signature = fixture.sign("3alice");
  auto hex = guardrail::schema::to_hex(signature);

  auto truncated = fixture.registry().register_user(
      "3alice", std::string_view{hex}.substr(0, 126));
  EXPECT_EQ(truncated.code, code_of(registry_error_code::malformed_signature));
  EXPECT_TRUE(fixture.registry().register_user("3alice", std::string_view{hex})
                  .ok());
}

TEST(registry_integration, day_rollover_restores_allowance) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_rollover"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());
  ASSERT_TRUE(registry.record_transaction("3alice", 100, "casino-1").ok());
  EXPECT_EQ(registry.check_eligibility("3alice", 1).status,
            eligibility_status_t::daily_limit_reached);

  fixture.advance(guardrail::execution::kDayWindow);
  auto check = registry.check_eligibility("3alice", 100);
  EXPECT_EQ(check.status, eligibility_status_t::eligible);
  EXPECT_EQ(check.remaining_daily, 100u);
  EXPECT_EQ(check.remaining_monthly, 900u);

  auto result = registry.record_transaction("3alice", 100, "casino-2");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.info, "daily_spent=100 monthly_spent=200");
}

TEST(registry_integration, self_exclusion_outranks_spent_limit) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_precedence"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());
  ASSERT_TRUE(registry.record_transaction("3alice", 100, "casino-1").ok());
  ASSERT_TRUE(registry.set_cooldown("3alice", 1).ok());
  ASSERT_TRUE(registry.self_exclude("3alice", 1).ok());

  EXPECT_EQ(registry.check_eligibility("3alice", 1).status,
            eligibility_status_t::self_excluded);
  EXPECT_EQ(registry.record_transaction("3alice", 1, "casino-1").code,
            code_of(registry_error_code::self_excluded));
}

TEST(registry_integration, self_exclusion_is_single_shot) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_exclusion"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());
  ASSERT_TRUE(registry.self_exclude("3alice", 2).ok());

  EXPECT_EQ(registry.self_exclude("3alice", 30).code,
            code_of(registry_error_code::already_excluded));
  EXPECT_EQ(registry.self_exclude("3alice", 1).code,
            code_of(registry_error_code::already_excluded));

  fixture.advance(2 * guardrail::schema::kMillisecondsPerDay);
  EXPECT_EQ(registry.check_eligibility("3alice", 1).status,
            eligibility_status_t::eligible);
  EXPECT_TRUE(registry.self_exclude("3alice", 1).ok());
}

TEST(registry_integration, cooldown_extends_but_never_shortens) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_cooldown"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());
  ASSERT_TRUE(registry.set_cooldown("3alice", 2).ok());

  EXPECT_EQ(registry.set_cooldown("3alice", 1).code,
            code_of(registry_error_code::cooldown_active));
  ASSERT_TRUE(registry.set_cooldown("3alice", 3).ok());

  auto check = registry.check_eligibility("3alice", 1);
  EXPECT_EQ(check.status, eligibility_status_t::on_cooldown);
  ASSERT_TRUE(check.blocked_until.has_value());
  EXPECT_EQ(*check.blocked_until,
            fixture.now() + 3 * guardrail::schema::kMillisecondsPerHour);

  fixture.advance(3 * guardrail::schema::kMillisecondsPerHour);
  EXPECT_EQ(registry.check_eligibility("3alice", 1).status,
            eligibility_status_t::eligible);
  EXPECT_TRUE(registry.set_cooldown("3alice", 1).ok());
}

TEST(registry_integration, limit_changes_keep_accumulated_spend) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_limits"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());
  ASSERT_TRUE(registry.record_transaction("3alice", 80, "casino-1").ok());

  ASSERT_TRUE(registry.set_limits("3alice", 50, 1000).ok());
  auto check = registry.check_eligibility("3alice", 1);
  EXPECT_EQ(check.status, eligibility_status_t::daily_limit_reached);
  EXPECT_EQ(check.remaining_daily, 0u);

  EXPECT_EQ(registry.set_limits("3alice", 0, 1000).code,
            code_of(registry_error_code::invalid_limits));
  EXPECT_EQ(registry.set_limits("3alice", 2000, 1000).code,
            code_of(registry_error_code::invalid_limits));

  auto record = registry.get_account("3alice");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->daily_limit, 50u);
  EXPECT_EQ(record->daily_spent, 80u);
}

TEST(registry_integration, failed_operations_leave_no_trace) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_atomic"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());
  ASSERT_TRUE(registry.record_transaction("3alice", 90, "casino-1").ok());
  auto before = registry.get_account("3alice");
  ASSERT_TRUE(before.has_value());

  EXPECT_FALSE(registry.record_transaction("3alice", 20, "casino-2").ok());
  EXPECT_FALSE(registry.record_transaction("3alice", 0, "casino-2").ok());
  EXPECT_FALSE(registry.set_limits("3alice", 500, 100).ok());
  EXPECT_FALSE(registry.self_exclude("3alice", 0).ok());
  EXPECT_FALSE(registry.set_cooldown("3alice", 8761).ok());

  auto after = registry.get_account("3alice");
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(*after, *before);
  EXPECT_EQ(registry.history("3alice", 0, 0).size(), 3u);
}

TEST(registry_integration, audit_chain_links_every_mutation) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_audit"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());
  fixture.advance(1000);
  ASSERT_TRUE(registry.record_transaction("3alice", 25, "casino-1").ok());
  ASSERT_TRUE(registry.set_cooldown("3alice", 4).ok());

  auto entries = registry.history("3alice", 0, 0);
  ASSERT_EQ(entries.size(), 4u);
  EXPECT_EQ(entries[0].operation,
            guardrail::schema::operation_type_t::register_user);
  EXPECT_EQ(entries[0].previous_root, guardrail::schema::make_zero_hash());
  EXPECT_EQ(entries[1].operation,
            guardrail::schema::operation_type_t::set_limits);
  EXPECT_EQ(entries[1].amount, 100u);
  EXPECT_EQ(entries[1].secondary_amount, 1000u);
  EXPECT_EQ(entries[2].operation,
            guardrail::schema::operation_type_t::record_transaction);
  EXPECT_EQ(entries[2].amount, 25u);
  ASSERT_TRUE(entries[2].platform_id.has_value());
  EXPECT_EQ(*entries[2].platform_id, "casino-1");
  EXPECT_EQ(entries[2].timestamp, fixture.now());
  EXPECT_EQ(entries[3].secondary_amount,
            fixture.now() + 4 * guardrail::schema::kMillisecondsPerHour);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    EXPECT_EQ(entries[i].sequence, i);
    EXPECT_NE(entries[i].root, entries[i].previous_root);
    if (i > 0) {
      EXPECT_EQ(entries[i].previous_root, entries[i - 1].root);
    }
  }

  auto record = registry.get_account("3alice");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->audit_sequence, 4u);
  EXPECT_EQ(record->audit_root, entries.back().root);

  auto page = registry.history("3alice", 2, 1);
  ASSERT_EQ(page.size(), 1u);
  EXPECT_EQ(page.front(), entries[2]);
  EXPECT_TRUE(registry.history("3bob", 0, 0).empty());
}

TEST(registry_integration, records_survive_reopen) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_reopen"};
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(fixture.registry().set_limits("3alice", 100, 1000).ok());
  ASSERT_TRUE(
      fixture.registry().record_transaction("3alice", 40, "casino-1").ok());
  auto before = fixture.registry().get_account("3alice");
  ASSERT_TRUE(before.has_value());
  fixture.storage().database.reset();

  auto encoder = guardrail::testing::scale_encoder_t{};
  auto storage = guardrail::storage::make_storage<
      guardrail::storage::rocksdb_storage_tag>(fixture.db_path());
  auto now = fixture.now();
  auto reopened = guardrail::execution::registry{
      encoder, storage, fixture.keypair().public_key,
      guardrail::crypto::kDefaultNetworkPrefix, [now] { return now; }};

  auto after = reopened.get_account("3alice");
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(*after, *before);
  EXPECT_EQ(reopened.check_eligibility("3alice", 60).status,
            eligibility_status_t::eligible);
  auto signature = fixture.sign("3alice");
  EXPECT_EQ(reopened
                .register_user("3alice",
                               guardrail::schema::bytes_view_t{signature})
                .code,
            code_of(registry_error_code::already_registered));
  EXPECT_EQ(reopened.history("3alice", 0, 0).size(), 3u);
}

TEST(registry_integration, concurrent_transactions_never_exceed_limit) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_concurrent"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(fixture.register_account("3alice").ok());
  ASSERT_TRUE(registry.set_limits("3alice", 100, 1000).ok());

  auto accepted = std::atomic<uint32_t>{};
  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      auto platform = "casino-" + std::to_string(t);
      for (auto i = 0; i < 25; ++i) {
        if (registry.record_transaction("3alice", 1, platform).ok()) {
          ++accepted;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(accepted.load(), 100u);
  auto record = registry.get_account("3alice");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->daily_spent, 100u);
  EXPECT_EQ(record->audit_sequence, 102u);
  EXPECT_EQ(registry.history("3alice", 0, 1000).size(), 102u);
}

TEST(registry_integration, unverified_record_is_blocked) {
  if (!guardrail::crypto::available()) {
    GTEST_SKIP() << "Ed25519 unavailable in this OpenSSL runtime";
  }
  auto fixture = guardrail::testing::registry_fixture{"guardrail_unverified"};
  fixture.store_record(guardrail::schema::compliance_record_t{
      .account = "3imported",
      .age_verified = false,
      .daily_limit = 100,
      .monthly_limit = 1000,
      .last_reset_day = guardrail::execution::bucket_start(
          fixture.now(), guardrail::execution::kDayWindow),
      .last_reset_month = guardrail::execution::bucket_start(
          fixture.now(), guardrail::execution::kMonthWindow)});

  auto& registry = fixture.registry();
  EXPECT_EQ(registry.check_eligibility("3imported", 1).status,
            eligibility_status_t::age_not_verified);
  EXPECT_EQ(registry.record_transaction("3imported", 1, "casino-1").code,
            code_of(registry_error_code::age_not_verified));
  EXPECT_EQ(registry.set_limits("3imported", 10, 100).code,
            code_of(registry_error_code::age_not_verified));
  EXPECT_EQ(fixture.register_account("3imported").code,
            code_of(registry_error_code::already_registered));
}
