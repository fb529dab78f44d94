#pragma once

#include <guardrail/schema/eligibility_status.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace guardrail::schema {

enum class registry_error_code : uint32_t {
  malformed_request = 1,
  malformed_signature = 2,
  invalid_amount = 3,
  invalid_duration = 4,
  invalid_limits = 5,
  invalid_signature = 10,
  already_registered = 11,
  already_excluded = 12,
  cooldown_active = 13,
  not_registered = 20,
  age_not_verified = 21,
  self_excluded = 22,
  on_cooldown = 23,
  daily_limit_reached = 24,
  monthly_limit_reached = 25,
};

enum class error_category_t : uint8_t {
  validation = 0,
  policy = 1,
  consistency = 2,
};

inline constexpr auto kValidationCodespace =
    std::string_view{"guardrail.validation"};
inline constexpr auto kPolicyCodespace = std::string_view{"guardrail.policy"};
inline constexpr auto kConsistencyCodespace =
    std::string_view{"guardrail.consistency"};

error_category_t category_of(registry_error_code code);
std::string_view codespace_of(registry_error_code code);
std::string_view to_string(registry_error_code code);

/// Map a blocking eligibility status to its error code; nullopt for eligible.
std::optional<registry_error_code> to_error_code(eligibility_status_t status);

}  // namespace guardrail::schema
