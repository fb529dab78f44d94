#include <guardrail/execution/time_window.hpp>

namespace guardrail::execution {

guardrail::schema::timestamp_milliseconds_t bucket_start(
    const guardrail::schema::timestamp_milliseconds_t timestamp,
    const guardrail::schema::duration_milliseconds_t length) {
  return (timestamp / length) * length;
}

window_decision evaluate_window(
    const guardrail::schema::timestamp_milliseconds_t now,
    const guardrail::schema::timestamp_milliseconds_t last_reset,
    const guardrail::schema::duration_milliseconds_t length) {
  if ((now / length) > (last_reset / length)) {
    return window_decision{.should_reset = true,
                           .bucket_start = bucket_start(now, length)};
  }
  return window_decision{.should_reset = false, .bucket_start = last_reset};
}

bool apply_pending_resets(guardrail::schema::compliance_record_t& record,
                          const guardrail::schema::timestamp_milliseconds_t now) {
  auto changed = false;

  auto day = evaluate_window(now, record.last_reset_day, kDayWindow);
  if (day.should_reset) {
    record.daily_spent = 0;
    record.last_reset_day = day.bucket_start;
    changed = true;
  }

  auto month = evaluate_window(now, record.last_reset_month, kMonthWindow);
  if (month.should_reset) {
    record.monthly_spent = 0;
    record.last_reset_month = month.bucket_start;
    changed = true;
  }

  return changed;
}

}  // namespace guardrail::execution
