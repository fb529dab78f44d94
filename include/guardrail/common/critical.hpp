#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace guardrail::common {

/// Log, flush and bring the process down. Reserved for failures of the
/// persistence and codec layers; policy outcomes never come through here.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// As above, with the backend's own status text appended.
[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail) {
  spdlog::critical("{}: {}", message, detail);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace guardrail::common
