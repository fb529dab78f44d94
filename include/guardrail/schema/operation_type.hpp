#pragma once

#include <guardrail/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation type.
// Kind of registry mutation recorded in an account's audit trail.
namespace guardrail::schema {

enum class operation_type_t : uint8_t {
  register_user = 0,
  set_limits = 1,
  record_transaction = 2,
  self_exclude = 3,
  set_cooldown = 4,
};

inline constexpr auto kOperationTypeMappings =
    std::array{std::pair<std::string_view, operation_type_t>{
                   "register_user", operation_type_t::register_user},
               std::pair<std::string_view, operation_type_t>{
                   "set_limits", operation_type_t::set_limits},
               std::pair<std::string_view, operation_type_t>{
                   "record_transaction", operation_type_t::record_transaction},
               std::pair<std::string_view, operation_type_t>{
                   "self_exclude", operation_type_t::self_exclude},
               std::pair<std::string_view, operation_type_t>{
                   "set_cooldown", operation_type_t::set_cooldown}};

template <>
struct enum_names<operation_type_t> final {
  static constexpr auto names = kOperationTypeMappings;
};

inline constexpr std::string_view to_string(const operation_type_t value) {
  return name_of(value);
}

}  // namespace guardrail::schema
