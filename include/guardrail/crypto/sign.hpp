#pragma once

#include <guardrail/schema/primitives.hpp>

#include <optional>

namespace guardrail::crypto {

struct ed25519_keypair final {
  guardrail::schema::ed25519_private_key_t private_key{};
  guardrail::schema::ed25519_public_key_t public_key{};
};

std::optional<ed25519_keypair> generate_ed25519_keypair();

std::optional<guardrail::schema::ed25519_public_key_t>
derive_ed25519_public_key(
    const guardrail::schema::ed25519_private_key_t& private_key);

std::optional<guardrail::schema::ed25519_signature_t> sign_ed25519(
    const guardrail::schema::bytes_view_t& message,
    const guardrail::schema::ed25519_private_key_t& private_key);

}  // namespace guardrail::crypto
