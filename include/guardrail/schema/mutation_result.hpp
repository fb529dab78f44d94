#pragma once

#include <cstdint>
#include <string>

namespace guardrail::schema {

template <uint16_t Version>
struct mutation_result;

// code 0 is success; anything else is a registry_error_code.
template <>
struct mutation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;

  bool ok() const { return code == 0; }
};

using mutation_result_t = mutation_result<1>;

}  // namespace guardrail::schema
