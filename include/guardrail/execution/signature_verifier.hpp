#pragma once

#include <guardrail/schema/primitives.hpp>
#include <functional>

namespace guardrail::execution {

using signature_verifier_t =
    std::function<bool(const guardrail::schema::bytes_view_t& message,
                       const guardrail::schema::ed25519_public_key_t& public_key,
                       const guardrail::schema::bytes_view_t& signature)>;

/// Verifier backed by OpenSSL Ed25519.
signature_verifier_t make_ed25519_verifier();

}  // namespace guardrail::execution
