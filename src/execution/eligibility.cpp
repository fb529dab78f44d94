#include <guardrail/execution/eligibility.hpp>
#include <guardrail/execution/time_window.hpp>

namespace guardrail::execution {

using namespace guardrail::schema;

namespace {

amount_t remaining(const amount_t spent, const amount_t limit) {
  return spent >= limit ? 0 : limit - spent;
}

bool active(const std::optional<timestamp_milliseconds_t>& until,
            const timestamp_milliseconds_t now) {
  return until.has_value() && *until > now;
}

}  // namespace

bool exceeds_limit(const amount_t spent,
                   const amount_t amount,
                   const amount_t limit) {
  return spent > limit || amount > limit - spent;
}

eligibility_result_t evaluate_eligibility(
    const std::optional<compliance_record_t>& record,
    const amount_t proposed_amount,
    const timestamp_milliseconds_t now) {
  auto result = eligibility_result_t{};
  if (!record.has_value()) {
    result.status = eligibility_status_t::not_registered;
    return result;
  }

  auto current = *record;
  apply_pending_resets(current, now);
  result.remaining_daily = remaining(current.daily_spent, current.daily_limit);
  result.remaining_monthly =
      remaining(current.monthly_spent, current.monthly_limit);

  if (!current.age_verified) {
    result.status = eligibility_status_t::age_not_verified;
  } else if (active(current.self_excluded_until, now)) {
    result.status = eligibility_status_t::self_excluded;
    result.blocked_until = current.self_excluded_until;
  } else if (active(current.cooldown_until, now)) {
    result.status = eligibility_status_t::on_cooldown;
    result.blocked_until = current.cooldown_until;
  } else if (exceeds_limit(current.daily_spent, proposed_amount,
                           current.daily_limit)) {
    result.status = eligibility_status_t::daily_limit_reached;
  } else if (exceeds_limit(current.monthly_spent, proposed_amount,
                           current.monthly_limit)) {
    result.status = eligibility_status_t::monthly_limit_reached;
  } else {
    result.status = eligibility_status_t::eligible;
  }
  return result;
}

}  // namespace guardrail::execution
