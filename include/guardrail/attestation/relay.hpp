#pragma once

#include <guardrail/common/clock.hpp>
#include <guardrail/crypto/attestation_message.hpp>
#include <guardrail/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace guardrail::attestation {

enum class proof_verdict_t : uint8_t {
  valid = 0,
  rejected = 1,
  // Verifier could not be reached or answered with a server error.
  unreachable = 2,
};

struct proof_verification final {
  proof_verdict_t verdict{proof_verdict_t::unreachable};
  std::string detail;
};

/// Third-party age proof check. Called with the raw account identifier and
/// the opaque proof payload.
using proof_verifier_t = std::function<proof_verification(
    std::string_view account_identifier,
    std::string_view proof)>;

enum class relay_status_t : uint8_t {
  attested = 0,
  malformed_request = 1,
  invalid_proof = 2,
  upstream_unavailable = 3,
  signing_failed = 4,
};

struct attestation_request final {
  std::string account_identifier;
  std::string proof;
};

struct attestation_response final {
  relay_status_t status{relay_status_t::malformed_request};
  uint16_t http_status{400};
  std::string signature_hex;
  std::string account_identifier;
  guardrail::schema::timestamp_milliseconds_t timestamp{};
  std::string message;

  bool ok() const { return status == relay_status_t::attested; }
  /// Only upstream failures are worth retrying unchanged.
  bool retryable() const {
    return status == relay_status_t::upstream_unavailable;
  }
};

/// HTTP-style status for a relay outcome: 200, 400, 502 or 500.
uint16_t http_status_of(relay_status_t status);
std::string_view to_string(relay_status_t status);

/// Age attestation relay: forwards a proof to the verifier and, when it is
/// accepted, signs the account identifier with the attestor key so the
/// registry will admit it.
class relay final {
 public:
  explicit relay(const guardrail::schema::ed25519_private_key_t& private_key,
                 proof_verifier_t verifier,
                 std::optional<char> network_prefix =
                     guardrail::crypto::kDefaultNetworkPrefix,
                 guardrail::common::time_source_t clock =
                     guardrail::common::system_time_source());

  attestation_response verify_and_sign(const attestation_request& request);

  const guardrail::schema::ed25519_public_key_t& public_key() const;
  std::string public_key_hex() const;

 private:
  attestation_response make_response(relay_status_t status,
                                     std::string account_identifier,
                                     std::string message) const;

  guardrail::schema::ed25519_private_key_t private_key_;
  guardrail::schema::ed25519_public_key_t public_key_{};
  proof_verifier_t verifier_;
  std::optional<char> network_prefix_;
  guardrail::common::time_source_t clock_;
};

}  // namespace guardrail::attestation
