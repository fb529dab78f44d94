#pragma once

#include <guardrail/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

// Schema type: compliance record.
// Per-account responsible-gambling state shared by every integrated platform.
// Created on successful registration and never deleted.
namespace guardrail::schema {

template <uint16_t Version>
struct compliance_record;

template <>
struct compliance_record<1> final {
  uint16_t version{1};
  account_id_t account;
  bool age_verified{};
  amount_t daily_limit{};
  amount_t monthly_limit{};
  amount_t daily_spent{};
  amount_t monthly_spent{};
  timestamp_milliseconds_t last_reset_day{};
  timestamp_milliseconds_t last_reset_month{};
  std::optional<timestamp_milliseconds_t> cooldown_until;
  std::optional<timestamp_milliseconds_t> self_excluded_until;
  std::set<platform_id_t> platforms_used;
  timestamp_milliseconds_t registered_at{};
  uint64_t audit_sequence{};
  hash32_t audit_root{};

  bool operator==(const compliance_record<1>&) const = default;
};

using compliance_record_t = compliance_record<1>;

}  // namespace guardrail::schema
