#pragma once

#include <guardrail/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: eligibility status.
// Outcome of a wager eligibility decision. Declaration order is the
// evaluation precedence; the first matching blocking reason is reported.
namespace guardrail::schema {

enum class eligibility_status_t : uint8_t {
  eligible = 0,
  not_registered = 1,
  age_not_verified = 2,
  self_excluded = 3,
  on_cooldown = 4,
  daily_limit_reached = 5,
  monthly_limit_reached = 6,
};

inline constexpr auto kEligibilityStatusMappings =
    std::array{std::pair<std::string_view, eligibility_status_t>{
                   "eligible", eligibility_status_t::eligible},
               std::pair<std::string_view, eligibility_status_t>{
                   "not_registered", eligibility_status_t::not_registered},
               std::pair<std::string_view, eligibility_status_t>{
                   "age_not_verified", eligibility_status_t::age_not_verified},
               std::pair<std::string_view, eligibility_status_t>{
                   "self_excluded", eligibility_status_t::self_excluded},
               std::pair<std::string_view, eligibility_status_t>{
                   "on_cooldown", eligibility_status_t::on_cooldown},
               std::pair<std::string_view, eligibility_status_t>{
                   "daily_limit_reached",
                   eligibility_status_t::daily_limit_reached},
               std::pair<std::string_view, eligibility_status_t>{
                   "monthly_limit_reached",
                   eligibility_status_t::monthly_limit_reached}};

template <>
struct enum_names<eligibility_status_t> final {
  static constexpr auto names = kEligibilityStatusMappings;
};

inline constexpr std::string_view to_string(const eligibility_status_t value) {
  return name_of(value);
}

}  // namespace guardrail::schema
