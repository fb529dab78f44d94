#include <guardrail/crypto/verify.hpp>
#include <guardrail/execution/signature_verifier.hpp>

namespace guardrail::execution {

signature_verifier_t make_ed25519_verifier() {
  return [](const guardrail::schema::bytes_view_t& message,
            const guardrail::schema::ed25519_public_key_t& public_key,
            const guardrail::schema::bytes_view_t& signature) {
    return guardrail::crypto::verify_ed25519(
        message, guardrail::schema::bytes_view_t{public_key}, signature);
  };
}

}  // namespace guardrail::execution
