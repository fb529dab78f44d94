#pragma once
#include <guardrail/schema/primitives.hpp>
#include <optional>
#include <span>

namespace guardrail::schema::encoding {

// Codec selected at build time by tag. Values written to the account store
// and audit trail go through this interface only.
template <typename Library>
struct encoder {
  template <typename T>
  guardrail::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, guardrail::schema::bytes_t& out);

  template <typename T>
  T decode(const guardrail::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const guardrail::schema::bytes_view_t& bytes);
};

}  // namespace guardrail::schema::encoding
