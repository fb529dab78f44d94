#pragma once

#include <guardrail/schema/compliance_record.hpp>
#include <guardrail/schema/primitives.hpp>

namespace guardrail::execution {

inline constexpr auto kDayWindow = guardrail::schema::kMillisecondsPerDay;
// Fixed 30-day window anchored at the Unix epoch, not a calendar month.
inline constexpr auto kMonthWindow = 30 * guardrail::schema::kMillisecondsPerDay;

struct window_decision final {
  bool should_reset{};
  guardrail::schema::timestamp_milliseconds_t bucket_start{};
};

/// Start of the fixed-length bucket containing `timestamp`.
guardrail::schema::timestamp_milliseconds_t bucket_start(
    guardrail::schema::timestamp_milliseconds_t timestamp,
    guardrail::schema::duration_milliseconds_t length);

/// Decide whether spend accumulated since `last_reset` belongs to an earlier
/// bucket than `now`. Only a strictly later bucket resets; a clock that moved
/// backwards keeps the stored bucket.
window_decision evaluate_window(
    guardrail::schema::timestamp_milliseconds_t now,
    guardrail::schema::timestamp_milliseconds_t last_reset,
    guardrail::schema::duration_milliseconds_t length);

/// Zero the accumulators of every window that has rolled over and advance its
/// bucket start. Returns true when the record changed.
bool apply_pending_resets(guardrail::schema::compliance_record_t& record,
                          guardrail::schema::timestamp_milliseconds_t now);

}  // namespace guardrail::execution
