#include <guardrail/blake3/hash.hpp>
#include <guardrail/execution/eligibility.hpp>
#include <guardrail/execution/registry.hpp>
#include <guardrail/execution/time_window.hpp>
#include <guardrail/schema/key/registry_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <limits>
#include <string>
#include <tuple>
#include <utility>

using namespace guardrail::execution;
using namespace guardrail::schema;

namespace {

mutation_result_t make_success(std::string info = {}) {
  return mutation_result_t{.code = 0, .log = "ok", .info = std::move(info)};
}

mutation_result_t make_error(const registry_error_code code,
                             std::string info = {}) {
  return mutation_result_t{.code = static_cast<uint32_t>(code),
                           .log = std::string{to_string(code)},
                           .info = std::move(info),
                           .codespace = std::string{codespace_of(code)}};
}

std::optional<mutation_result_t> validate_account(
    const std::string_view account) {
  if (account.empty() || account.size() > kMaxAccountIdSize) {
    return make_error(registry_error_code::malformed_request,
                      "account identifier must be 1-128 bytes");
  }
  return std::nullopt;
}

bool active(const std::optional<timestamp_milliseconds_t>& until,
            const timestamp_milliseconds_t now) {
  return until.has_value() && *until > now;
}

std::optional<timestamp_milliseconds_t> checked_deadline(
    const timestamp_milliseconds_t now,
    const duration_milliseconds_t duration) {
  if (now > std::numeric_limits<timestamp_milliseconds_t>::max() - duration) {
    return std::nullopt;
  }
  return now + duration;
}

hash32_t fold_audit_root(const hash32_t& previous_root,
                         const bytes_t& account_key,
                         const bytes_t& entry_body) {
  return guardrail::blake3::hasher{}
      .update(bytes_view_t{previous_root})
      .update(bytes_view_t{account_key})
      .update(bytes_view_t{entry_body})
      .finalize();
}

}  // namespace

namespace guardrail::execution {

registry::registry(encoder_t& encoder,
                   storage_t& storage,
                   const ed25519_public_key_t& attestor_public_key,
                   std::optional<char> network_prefix,
                   guardrail::common::time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      attestor_public_key_{attestor_public_key},
      network_prefix_{network_prefix},
      clock_{std::move(clock)},
      verifier_{make_ed25519_verifier()} {}

mutation_result_t registry::register_user(const std::string_view account,
                                          const bytes_view_t& signature) {
  if (auto invalid = validate_account(account)) {
    return *invalid;
  }
  if (signature.size() != std::tuple_size_v<ed25519_signature_t>) {
    return make_error(registry_error_code::malformed_signature,
                      "signature must be 64 bytes");
  }

  auto message =
      guardrail::crypto::make_attestation_message(account, network_prefix_);
  if (!verifier_(message, attestor_public_key_, signature)) {
    spdlog::warn("Rejected registration for '{}': signature mismatch",
                 account);
    return make_error(registry_error_code::invalid_signature);
  }

  auto lock = std::scoped_lock{account_mutex(account)};
  if (load(account).has_value()) {
    return make_error(registry_error_code::already_registered);
  }

  auto now = clock_();
  auto record = compliance_record_t{
      .account = std::string{account},
      .age_verified = true,
      .last_reset_day = bucket_start(now, kDayWindow),
      .last_reset_month = bucket_start(now, kMonthWindow),
      .registered_at = now};
  commit(record, now, operation_type_t::register_user, 0, 0, std::nullopt);
  spdlog::info("Registered account '{}'", account);
  return make_success();
}

mutation_result_t registry::register_user(const std::string_view account,
                                          const std::string_view signature_hex) {
  auto signature = try_make_ed25519_signature(signature_hex);
  if (!signature.has_value()) {
    return make_error(registry_error_code::malformed_signature,
                      "signature must be 128 hex characters");
  }
  return register_user(account, bytes_view_t{*signature});
}

mutation_result_t registry::set_limits(const std::string_view account,
                                       const amount_t daily_limit,
                                       const amount_t monthly_limit) {
  if (auto invalid = validate_account(account)) {
    return *invalid;
  }
  if (daily_limit == 0 || monthly_limit == 0) {
    return make_error(registry_error_code::invalid_limits,
                      "limits must be non-zero");
  }
  if (daily_limit > monthly_limit) {
    return make_error(registry_error_code::invalid_limits,
                      "daily limit exceeds monthly limit");
  }

  auto lock = std::scoped_lock{account_mutex(account)};
  auto record = load(account);
  if (!record.has_value()) {
    return make_error(registry_error_code::not_registered);
  }
  if (!record->age_verified) {
    return make_error(registry_error_code::age_not_verified);
  }

  auto now = clock_();
  apply_pending_resets(*record, now);
  record->daily_limit = daily_limit;
  record->monthly_limit = monthly_limit;
  commit(*record, now, operation_type_t::set_limits, daily_limit,
         monthly_limit, std::nullopt);
  spdlog::info("Set limits for '{}': daily={} monthly={}", account,
               daily_limit, monthly_limit);
  return make_success();
}

eligibility_result_t registry::check_eligibility(
    const std::string_view account,
    const amount_t proposed_amount) const {
  if (account.empty() || account.size() > kMaxAccountIdSize) {
    return eligibility_result_t{.status = eligibility_status_t::not_registered};
  }
  return evaluate_eligibility(load(account), proposed_amount, clock_());
}

mutation_result_t registry::record_transaction(
    const std::string_view account,
    const amount_t amount,
    const std::string_view platform_id) {
  if (auto invalid = validate_account(account)) {
    return *invalid;
  }
  if (amount == 0) {
    return make_error(registry_error_code::invalid_amount,
                      "amount must be positive");
  }
  if (platform_id.empty() || platform_id.size() > kMaxPlatformIdSize) {
    return make_error(registry_error_code::malformed_request,
                      "platform id must be 1-64 bytes");
  }

  auto lock = std::scoped_lock{account_mutex(account)};
  auto record = load(account);
  auto now = clock_();
  auto decision = evaluate_eligibility(record, amount, now);
  if (auto code = to_error_code(decision.status)) {
    spdlog::debug("Rejected transaction of {} for '{}' on '{}': {}", amount,
                  account, platform_id, to_string(decision.status));
    return make_error(*code);
  }

  apply_pending_resets(*record, now);
  record->daily_spent += amount;
  record->monthly_spent += amount;
  record->platforms_used.insert(std::string{platform_id});
  commit(*record, now, operation_type_t::record_transaction, amount, 0,
         std::string{platform_id});
  spdlog::info("Recorded {} for '{}' on '{}'", amount, account, platform_id);
  return make_success("daily_spent=" + std::to_string(record->daily_spent) +
                      " monthly_spent=" +
                      std::to_string(record->monthly_spent));
}

mutation_result_t registry::self_exclude(const std::string_view account,
                                         const uint32_t duration_days) {
  if (auto invalid = validate_account(account)) {
    return *invalid;
  }
  if (duration_days == 0 || duration_days > kMaxSelfExclusionDays) {
    return make_error(registry_error_code::invalid_duration,
                      "duration must be 1-36500 days");
  }

  auto lock = std::scoped_lock{account_mutex(account)};
  auto record = load(account);
  if (!record.has_value()) {
    return make_error(registry_error_code::not_registered);
  }

  auto now = clock_();
  if (active(record->self_excluded_until, now)) {
    return make_error(registry_error_code::already_excluded);
  }
  auto until = checked_deadline(now, duration_days * kMillisecondsPerDay);
  if (!until.has_value()) {
    return make_error(registry_error_code::invalid_duration);
  }

  record->self_excluded_until = *until;
  commit(*record, now, operation_type_t::self_exclude, duration_days, *until,
         std::nullopt);
  spdlog::info("Account '{}' self-excluded until {}", account, *until);
  return make_success();
}

mutation_result_t registry::set_cooldown(const std::string_view account,
                                         const uint32_t duration_hours) {
  if (auto invalid = validate_account(account)) {
    return *invalid;
  }
  if (duration_hours == 0 || duration_hours > kMaxCooldownHours) {
    return make_error(registry_error_code::invalid_duration,
                      "duration must be 1-8760 hours");
  }

  auto lock = std::scoped_lock{account_mutex(account)};
  auto record = load(account);
  if (!record.has_value()) {
    return make_error(registry_error_code::not_registered);
  }
  if (!record->age_verified) {
    return make_error(registry_error_code::age_not_verified);
  }

  auto now = clock_();
  auto until = checked_deadline(now, duration_hours * kMillisecondsPerHour);
  if (!until.has_value()) {
    return make_error(registry_error_code::invalid_duration);
  }
  if (active(record->cooldown_until, now) && *until < *record->cooldown_until) {
    return make_error(registry_error_code::cooldown_active);
  }

  record->cooldown_until = *until;
  commit(*record, now, operation_type_t::set_cooldown, duration_hours, *until,
         std::nullopt);
  spdlog::info("Account '{}' on cooldown until {}", account, *until);
  return make_success();
}

std::optional<compliance_record_t> registry::get_account(
    const std::string_view account) const {
  auto record = load(account);
  if (record.has_value()) {
    apply_pending_resets(*record, clock_());
  }
  return record;
}

std::vector<audit_entry_t> registry::history(const std::string_view account,
                                             const uint64_t from_sequence,
                                             const uint32_t limit) const {
  auto page = limit == 0 ? kDefaultHistoryLimit
                         : std::min(limit, kMaxHistoryLimit);
  auto prefix = guardrail::schema::key::make_account_history_prefix(account);
  auto start =
      guardrail::schema::key::make_account_history_key(account, from_sequence);
  auto rows = storage_.list_range(prefix, start, page);

  auto entries = std::vector<audit_entry_t>{};
  entries.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    entries.push_back(encoder_.decode<audit_entry_t>(bytes_view_t{value}));
  }
  return entries;
}

const ed25519_public_key_t& registry::attestor_public_key() const {
  return attestor_public_key_;
}

std::optional<char> registry::network_prefix() const {
  return network_prefix_;
}

void registry::set_signature_verifier(signature_verifier_t verifier) {
  verifier_ = std::move(verifier);
}

std::optional<compliance_record_t> registry::load(
    const std::string_view account) const {
  auto key = guardrail::schema::key::make_account_key(account);
  return storage_.get<compliance_record_t>(encoder_, key);
}

void registry::commit(compliance_record_t& record,
                      const timestamp_milliseconds_t now,
                      const operation_type_t operation,
                      const uint64_t amount,
                      const uint64_t secondary_amount,
                      std::optional<platform_id_t> platform_id) {
  auto entry = audit_entry_t{.sequence = record.audit_sequence,
                             .timestamp = now,
                             .operation = operation,
                             .amount = amount,
                             .secondary_amount = secondary_amount,
                             .platform_id = std::move(platform_id),
                             .previous_root = record.audit_root};
  auto account_key = guardrail::schema::key::make_account_key(record.account);
  auto body = encoder_.encode(std::tuple{entry.sequence, entry.timestamp,
                                         entry.operation, entry.amount,
                                         entry.secondary_amount,
                                         entry.platform_id});
  entry.root = fold_audit_root(entry.previous_root, account_key, body);

  record.audit_sequence = entry.sequence + 1;
  record.audit_root = entry.root;

  auto history_key = guardrail::schema::key::make_account_history_key(
      record.account, entry.sequence);
  storage_.commit({{account_key, encoder_.encode(record)},
                   {history_key, encoder_.encode(entry)}});
}

std::mutex& registry::account_mutex(const std::string_view account) {
  auto index = std::hash<std::string_view>{}(account) % account_mutexes_.size();
  return account_mutexes_[index];
}

}  // namespace guardrail::execution
