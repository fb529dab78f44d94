#pragma once
#include <blake3.h>
#include <guardrail/schema/primitives.hpp>
#include <span>
#include <string_view>

namespace guardrail::blake3 {

/// Incremental BLAKE3-256. Feeding parts one by one gives the same digest as
/// hashing their concatenation.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const guardrail::schema::bytes_view_t& bytes);

  guardrail::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

guardrail::schema::hash32_t hash(const std::string_view& str);
guardrail::schema::hash32_t hash(const guardrail::schema::bytes_view_t& bytes);

}  // namespace guardrail::blake3
