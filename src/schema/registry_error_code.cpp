#include <guardrail/schema/registry_error_code.hpp>

namespace guardrail::schema {

error_category_t category_of(const registry_error_code code) {
  using enum registry_error_code;
  switch (code) {
    case malformed_request:
    case malformed_signature:
    case invalid_amount:
    case invalid_duration:
    case invalid_limits:
      return error_category_t::validation;
    case invalid_signature:
    case already_registered:
    case already_excluded:
    case cooldown_active:
      return error_category_t::consistency;
    case not_registered:
    case age_not_verified:
    case self_excluded:
    case on_cooldown:
    case daily_limit_reached:
    case monthly_limit_reached:
      return error_category_t::policy;
  }
  return error_category_t::validation;
}

std::string_view codespace_of(const registry_error_code code) {
  switch (category_of(code)) {
    case error_category_t::policy:
      return kPolicyCodespace;
    case error_category_t::consistency:
      return kConsistencyCodespace;
    case error_category_t::validation:
      return kValidationCodespace;
  }
  return kValidationCodespace;
}

std::string_view to_string(const registry_error_code code) {
  using enum registry_error_code;
  switch (code) {
    case malformed_request:
      return "malformed request";
    case malformed_signature:
      return "malformed signature";
    case invalid_amount:
      return "invalid amount";
    case invalid_duration:
      return "invalid duration";
    case invalid_limits:
      return "invalid limits";
    case invalid_signature:
      return "invalid signature";
    case already_registered:
      return "already registered";
    case already_excluded:
      return "already excluded";
    case cooldown_active:
      return "cooldown active";
    case not_registered:
      return "not registered";
    case age_not_verified:
      return "age not verified";
    case self_excluded:
      return "self excluded";
    case on_cooldown:
      return "on cooldown";
    case daily_limit_reached:
      return "daily limit reached";
    case monthly_limit_reached:
      return "monthly limit reached";
  }
  return "unknown";
}

std::optional<registry_error_code> to_error_code(
    const eligibility_status_t status) {
  switch (status) {
    case eligibility_status_t::eligible:
      return std::nullopt;
    case eligibility_status_t::not_registered:
      return registry_error_code::not_registered;
    case eligibility_status_t::age_not_verified:
      return registry_error_code::age_not_verified;
    case eligibility_status_t::self_excluded:
      return registry_error_code::self_excluded;
    case eligibility_status_t::on_cooldown:
      return registry_error_code::on_cooldown;
    case eligibility_status_t::daily_limit_reached:
      return registry_error_code::daily_limit_reached;
    case eligibility_status_t::monthly_limit_reached:
      return registry_error_code::monthly_limit_reached;
  }
  return std::nullopt;
}

}  // namespace guardrail::schema
