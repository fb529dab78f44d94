#pragma once

#include <guardrail/schema/operation_type.hpp>
#include <guardrail/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: audit entry.
// One row of an account's compliance trail. `amount` and `secondary_amount`
// carry the operation's arguments: transaction amount, daily and monthly
// limits, or the exclusion/cooldown end timestamp. `root` chains the entry to
// its predecessor.
namespace guardrail::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t timestamp{};
  operation_type_t operation{operation_type_t::register_user};
  uint64_t amount{};
  uint64_t secondary_amount{};
  std::optional<platform_id_t> platform_id;
  hash32_t previous_root{};
  hash32_t root{};

  bool operator==(const audit_entry<1>&) const = default;
};

using audit_entry_t = audit_entry<1>;

}  // namespace guardrail::schema
