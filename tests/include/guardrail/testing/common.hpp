#pragma once

#include <guardrail/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace guardrail::testing {

// 2023-11-14T22:13:20Z. Mid-bucket for both the day and 30-day windows.
inline constexpr auto kStartTime =
    guardrail::schema::timestamp_milliseconds_t{1'700'000'000'000};

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace guardrail::testing
