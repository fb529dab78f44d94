#include <guardrail/attestation/relay.hpp>
#include <guardrail/common/critical.hpp>
#include <guardrail/crypto/sign.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace guardrail::attestation {

uint16_t http_status_of(const relay_status_t status) {
  switch (status) {
    case relay_status_t::attested:
      return 200;
    case relay_status_t::malformed_request:
    case relay_status_t::invalid_proof:
      return 400;
    case relay_status_t::upstream_unavailable:
      return 502;
    case relay_status_t::signing_failed:
      return 500;
  }
  return 500;
}

std::string_view to_string(const relay_status_t status) {
  switch (status) {
    case relay_status_t::attested:
      return "attested";
    case relay_status_t::malformed_request:
      return "malformed request";
    case relay_status_t::invalid_proof:
      return "invalid proof";
    case relay_status_t::upstream_unavailable:
      return "upstream unavailable";
    case relay_status_t::signing_failed:
      return "signing failed";
  }
  return "unknown";
}

relay::relay(const guardrail::schema::ed25519_private_key_t& private_key,
             proof_verifier_t verifier,
             std::optional<char> network_prefix,
             guardrail::common::time_source_t clock)
    : private_key_{private_key},
      verifier_{std::move(verifier)},
      network_prefix_{network_prefix},
      clock_{std::move(clock)} {
  auto public_key = guardrail::crypto::derive_ed25519_public_key(private_key_);
  if (!public_key.has_value()) {
    guardrail::common::critical("failed to derive attestor public key");
  }
  public_key_ = *public_key;
  if (!verifier_) {
    guardrail::common::critical("attestation relay requires a proof verifier");
  }
}

attestation_response relay::verify_and_sign(
    const attestation_request& request) {
  if (request.account_identifier.empty() || request.proof.empty()) {
    return make_response(relay_status_t::malformed_request,
                         request.account_identifier,
                         "account identifier and proof are required");
  }

  auto verification = verifier_(request.account_identifier, request.proof);
  switch (verification.verdict) {
    case proof_verdict_t::rejected:
      spdlog::info("Proof rejected for '{}': {}", request.account_identifier,
                   verification.detail);
      return make_response(relay_status_t::invalid_proof,
                           request.account_identifier,
                           std::move(verification.detail));
    case proof_verdict_t::unreachable:
      spdlog::warn("Proof verifier unavailable for '{}': {}",
                   request.account_identifier, verification.detail);
      return make_response(relay_status_t::upstream_unavailable,
                           request.account_identifier,
                           std::move(verification.detail));
    case proof_verdict_t::valid:
      break;
  }

  auto message = guardrail::crypto::make_attestation_message(
      request.account_identifier, network_prefix_);
  auto signature = guardrail::crypto::sign_ed25519(message, private_key_);
  if (!signature.has_value()) {
    spdlog::error("Failed to sign attestation for '{}'",
                  request.account_identifier);
    return make_response(relay_status_t::signing_failed,
                         request.account_identifier, "signing failed");
  }

  auto response = make_response(relay_status_t::attested,
                                request.account_identifier, "age verified");
  response.signature_hex = guardrail::schema::to_hex(*signature);
  spdlog::info("Attested account '{}'", request.account_identifier);
  return response;
}

const guardrail::schema::ed25519_public_key_t& relay::public_key() const {
  return public_key_;
}

std::string relay::public_key_hex() const {
  return guardrail::schema::to_hex(public_key_);
}

attestation_response relay::make_response(const relay_status_t status,
                                          std::string account_identifier,
                                          std::string message) const {
  return attestation_response{.status = status,
                              .http_status = http_status_of(status),
                              .account_identifier =
                                  std::move(account_identifier),
                              .timestamp = clock_(),
                              .message = std::move(message)};
}

}  // namespace guardrail::attestation
