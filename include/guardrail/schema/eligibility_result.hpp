#pragma once

#include <guardrail/schema/eligibility_status.hpp>
#include <guardrail/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace guardrail::schema {

template <uint16_t Version>
struct eligibility_result;

template <>
struct eligibility_result<1> final {
  uint16_t version{1};
  eligibility_status_t status{eligibility_status_t::not_registered};
  amount_t remaining_daily{};
  amount_t remaining_monthly{};
  // Set for self_excluded and on_cooldown.
  std::optional<timestamp_milliseconds_t> blocked_until;
};

using eligibility_result_t = eligibility_result<1>;

}  // namespace guardrail::schema
