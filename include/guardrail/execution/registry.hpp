#pragma once

#include <guardrail/common/clock.hpp>
#include <guardrail/crypto/attestation_message.hpp>
#include <guardrail/execution/signature_verifier.hpp>
#include <guardrail/schema/audit_entry.hpp>
#include <guardrail/schema/compliance_record.hpp>
#include <guardrail/schema/eligibility_result.hpp>
#include <guardrail/schema/encoding/scale/encoder.hpp>
#include <guardrail/schema/mutation_result.hpp>
#include <guardrail/schema/operation_type.hpp>
#include <guardrail/schema/primitives.hpp>
#include <guardrail/schema/registry_error_code.hpp>
#include <guardrail/storage/rocksdb/storage.hpp>
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace guardrail::execution {

inline constexpr std::size_t kMaxAccountIdSize = 128;
inline constexpr std::size_t kMaxPlatformIdSize = 64;
inline constexpr uint32_t kMaxSelfExclusionDays = 36'500;
inline constexpr uint32_t kMaxCooldownHours = 8'760;
inline constexpr uint32_t kDefaultHistoryLimit = 100;
inline constexpr uint32_t kMaxHistoryLimit = 1'000;

/// Cross-platform compliance registry.
///
/// Owns every account's compliance record, gates registration on an Ed25519
/// attestation from the trusted attestor, and decides whether a wager is
/// allowed. Records live in the injected storage; the registry keeps no
/// account state of its own.
///
/// Mutations are serialized per account and write the record together with
/// its audit entry in a single batch, so a failed operation leaves nothing
/// behind. Reads take no account lock.
class registry final {
 public:
  using encoder_t = guardrail::schema::encoding::scale_encoder_t;
  using storage_t =
      guardrail::storage::storage<guardrail::storage::rocksdb_storage_tag>;

  /// Construct the registry over caller-owned encoder and storage.
  ///
  /// `attestor_public_key` is the only key whose signatures register users.
  /// `network_prefix` is stripped from account identifiers before
  /// verification; pass std::nullopt to verify identifiers verbatim.
  explicit registry(
      encoder_t& encoder,
      storage_t& storage,
      const guardrail::schema::ed25519_public_key_t& attestor_public_key,
      std::optional<char> network_prefix =
          guardrail::crypto::kDefaultNetworkPrefix,
      guardrail::common::time_source_t clock =
          guardrail::common::system_time_source());

  /// Create an age-verified record for `account`.
  ///
  /// The signature must be the attestor's Ed25519 signature over the account
  /// identifier with its network prefix stripped. Fails with
  /// `invalid_signature` on mismatch and `already_registered` if a record
  /// exists; registration is never idempotent.
  guardrail::schema::mutation_result_t register_user(
      std::string_view account,
      const guardrail::schema::bytes_view_t& signature);

  /// Hex form of `register_user`; the signature must be exactly 128 hex
  /// characters (optionally 0x-prefixed).
  guardrail::schema::mutation_result_t register_user(
      std::string_view account,
      std::string_view signature_hex);

  /// Overwrite both spending limits.
  ///
  /// Requires a registered, age-verified record. Both limits must be non-zero
  /// and the daily limit may not exceed the monthly limit. Spend already
  /// accumulated in the current windows is left as is.
  guardrail::schema::mutation_result_t set_limits(
      std::string_view account,
      guardrail::schema::amount_t daily_limit,
      guardrail::schema::amount_t monthly_limit);

  /// Decide whether `proposed_amount` could be wagered now. No mutation.
  guardrail::schema::eligibility_result_t check_eligibility(
      std::string_view account,
      guardrail::schema::amount_t proposed_amount) const;

  /// Record a wager made on `platform_id`.
  ///
  /// Re-runs the eligibility decision under the account lock; any blocking
  /// status is returned as the matching error code and nothing is written.
  /// On success pending window resets are applied, the amount is added to
  /// both accumulators and the platform joins `platforms_used`.
  guardrail::schema::mutation_result_t record_transaction(
      std::string_view account,
      guardrail::schema::amount_t amount,
      std::string_view platform_id);

  /// Exclude the account from all wagering for `duration_days`.
  ///
  /// Single shot: fails with `already_excluded` while an exclusion is active,
  /// it can neither be extended nor shortened until it lapses.
  guardrail::schema::mutation_result_t self_exclude(std::string_view account,
                                                    uint32_t duration_days);

  /// Block wagering for `duration_hours`. An active cooldown can be extended
  /// but never shortened (`cooldown_active`).
  guardrail::schema::mutation_result_t set_cooldown(std::string_view account,
                                                    uint32_t duration_hours);

  /// Current record with pending window resets applied to the returned copy.
  std::optional<guardrail::schema::compliance_record_t> get_account(
      std::string_view account) const;

  /// Audit entries for `account` starting at `from_sequence`, in order.
  ///
  /// `limit` of 0 selects the default page size; larger values are capped.
  std::vector<guardrail::schema::audit_entry_t> history(
      std::string_view account,
      uint64_t from_sequence,
      uint32_t limit) const;

  const guardrail::schema::ed25519_public_key_t& attestor_public_key() const;
  std::optional<char> network_prefix() const;

  /// Replace the signature check, e.g. to observe calls in tests.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  std::optional<guardrail::schema::compliance_record_t> load(
      std::string_view account) const;

  /// Append an audit entry for `operation`, fold it into the record's audit
  /// chain and commit record and entry together.
  void commit(guardrail::schema::compliance_record_t& record,
              guardrail::schema::timestamp_milliseconds_t now,
              guardrail::schema::operation_type_t operation,
              uint64_t amount,
              uint64_t secondary_amount,
              std::optional<guardrail::schema::platform_id_t> platform_id);

  /// Lock shared by every operation on `account`. Accounts map onto a fixed
  /// stripe of mutexes, so two accounts may share one.
  std::mutex& account_mutex(std::string_view account);

  encoder_t& encoder_;
  storage_t& storage_;
  guardrail::schema::ed25519_public_key_t attestor_public_key_;
  std::optional<char> network_prefix_;
  guardrail::common::time_source_t clock_;
  signature_verifier_t verifier_;
  std::array<std::mutex, 64> account_mutexes_;
};

}  // namespace guardrail::execution
