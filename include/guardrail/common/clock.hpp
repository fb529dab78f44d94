#pragma once

#include <guardrail/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace guardrail::common {

/// Source of "now" in Unix milliseconds.
using time_source_t =
    std::function<guardrail::schema::timestamp_milliseconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<guardrail::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  };
}

}  // namespace guardrail::common
