#pragma once

#include <guardrail/schema/primitives.hpp>

namespace guardrail::crypto {

/// True when the linked OpenSSL exposes Ed25519.
bool available();

/// Standard Ed25519 verification. Fails closed: wrong key or signature
/// length, a key OpenSSL rejects, or a mismatch all return false.
bool verify_ed25519(const guardrail::schema::bytes_view_t& message,
                    const guardrail::schema::bytes_view_t& public_key,
                    const guardrail::schema::bytes_view_t& signature);

}  // namespace guardrail::crypto
