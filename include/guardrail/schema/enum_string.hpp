#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace guardrail::schema {

// Specialize with `static constexpr auto names`, an array of
// (name, value) pairs, to make an enum printable and parseable by name.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::names) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::string_view name_of(const Enum value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::names) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace guardrail::schema
