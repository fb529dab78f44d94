#pragma once

#include <guardrail/schema/compliance_record.hpp>
#include <guardrail/schema/eligibility_result.hpp>
#include <guardrail/schema/primitives.hpp>

#include <optional>

namespace guardrail::execution {

/// Pure wager decision. Checks run in a fixed order and the first blocking
/// reason wins:
/// not_registered, age_not_verified, self_excluded, on_cooldown,
/// daily_limit_reached, monthly_limit_reached, otherwise eligible.
///
/// Pending window resets are applied to a copy of the record; the input is
/// never modified.
guardrail::schema::eligibility_result_t evaluate_eligibility(
    const std::optional<guardrail::schema::compliance_record_t>& record,
    guardrail::schema::amount_t proposed_amount,
    guardrail::schema::timestamp_milliseconds_t now);

/// `spent + amount > limit` without overflow.
bool exceeds_limit(guardrail::schema::amount_t spent,
                   guardrail::schema::amount_t amount,
                   guardrail::schema::amount_t limit);

}  // namespace guardrail::execution
