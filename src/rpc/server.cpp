#include <spdlog/spdlog.h>
#include <guardrail/rpc/server.hpp>
#include <string>

using namespace guardrail::rpc;
using namespace guardrail::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_mutation_reply(const mutation_result_t& source,
                             guardrail::rpc::v1::MutationReply* destination) {
  destination->set_success(source.ok());
  destination->set_code(source.code);
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
}

guardrail::rpc::v1::EligibilityStatus map_status(
    const eligibility_status_t status) {
  using enum eligibility_status_t;
  switch (status) {
    case eligible:
      return guardrail::rpc::v1::ELIGIBILITY_STATUS_ELIGIBLE;
    case not_registered:
      return guardrail::rpc::v1::ELIGIBILITY_STATUS_NOT_REGISTERED;
    case age_not_verified:
      return guardrail::rpc::v1::ELIGIBILITY_STATUS_AGE_NOT_VERIFIED;
    case self_excluded:
      return guardrail::rpc::v1::ELIGIBILITY_STATUS_SELF_EXCLUDED;
    case on_cooldown:
      return guardrail::rpc::v1::ELIGIBILITY_STATUS_ON_COOLDOWN;
    case daily_limit_reached:
      return guardrail::rpc::v1::ELIGIBILITY_STATUS_DAILY_LIMIT_REACHED;
    case monthly_limit_reached:
      return guardrail::rpc::v1::ELIGIBILITY_STATUS_MONTHLY_LIMIT_REACHED;
  }
  return guardrail::rpc::v1::ELIGIBILITY_STATUS_NOT_REGISTERED;
}

guardrail::rpc::v1::Operation map_operation(const operation_type_t operation) {
  using enum operation_type_t;
  switch (operation) {
    case register_user:
      return guardrail::rpc::v1::OPERATION_REGISTER_USER;
    case set_limits:
      return guardrail::rpc::v1::OPERATION_SET_LIMITS;
    case record_transaction:
      return guardrail::rpc::v1::OPERATION_RECORD_TRANSACTION;
    case self_exclude:
      return guardrail::rpc::v1::OPERATION_SELF_EXCLUDE;
    case set_cooldown:
      return guardrail::rpc::v1::OPERATION_SET_COOLDOWN;
  }
  return guardrail::rpc::v1::OPERATION_REGISTER_USER;
}

void populate_record(const compliance_record_t& source,
                     guardrail::rpc::v1::ComplianceRecord* destination) {
  destination->set_account(source.account);
  destination->set_age_verified(source.age_verified);
  destination->set_daily_limit(source.daily_limit);
  destination->set_monthly_limit(source.monthly_limit);
  destination->set_daily_spent(source.daily_spent);
  destination->set_monthly_spent(source.monthly_spent);
  destination->set_last_reset_day_ms(source.last_reset_day);
  destination->set_last_reset_month_ms(source.last_reset_month);
  if (source.cooldown_until.has_value()) {
    destination->set_cooldown_until_ms(*source.cooldown_until);
  }
  if (source.self_excluded_until.has_value()) {
    destination->set_self_excluded_until_ms(*source.self_excluded_until);
  }
  for (const auto& platform : source.platforms_used) {
    destination->add_platforms_used(platform);
  }
  destination->set_registered_at_ms(source.registered_at);
  destination->set_audit_sequence(source.audit_sequence);
  destination->set_audit_root(std::string{std::begin(source.audit_root),
                                          std::end(source.audit_root)});
}

void populate_entry(const audit_entry_t& source,
                    guardrail::rpc::v1::AuditEntry* destination) {
  destination->set_sequence(source.sequence);
  destination->set_timestamp_ms(source.timestamp);
  destination->set_operation(map_operation(source.operation));
  destination->set_amount(source.amount);
  destination->set_secondary_amount(source.secondary_amount);
  if (source.platform_id.has_value()) {
    destination->set_platform_id(*source.platform_id);
  }
  destination->set_previous_root(std::string{std::begin(source.previous_root),
                                             std::end(source.previous_root)});
  destination->set_root(
      std::string{std::begin(source.root), std::end(source.root)});
}

}  // namespace

listener::listener(guardrail::execution::registry& registry)
    : registry_{registry} {}

grpc::ServerUnaryReactor* listener::RegisterUser(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::RegisterUserRequest* request,
    guardrail::rpc::v1::MutationReply* response) {
  auto result = registry_.register_user(
      request->account(), std::string_view{request->signature_hex()});
  populate_mutation_reply(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SetLimits(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::SetLimitsRequest* request,
    guardrail::rpc::v1::MutationReply* response) {
  auto result = registry_.set_limits(request->account(), request->daily_limit(),
                                     request->monthly_limit());
  populate_mutation_reply(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckEligibility(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::CheckEligibilityRequest* request,
    guardrail::rpc::v1::EligibilityReply* response) {
  auto result = registry_.check_eligibility(request->account(),
                                            request->proposed_amount());
  response->set_status(map_status(result.status));
  response->set_remaining_daily(result.remaining_daily);
  response->set_remaining_monthly(result.remaining_monthly);
  if (result.blocked_until.has_value()) {
    response->set_blocked_until_ms(*result.blocked_until);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RecordTransaction(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::RecordTransactionRequest* request,
    guardrail::rpc::v1::MutationReply* response) {
  auto result = registry_.record_transaction(
      request->account(), request->amount(), request->platform_id());
  populate_mutation_reply(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SelfExclude(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::SelfExcludeRequest* request,
    guardrail::rpc::v1::MutationReply* response) {
  auto result =
      registry_.self_exclude(request->account(), request->duration_days());
  populate_mutation_reply(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SetCooldown(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::SetCooldownRequest* request,
    guardrail::rpc::v1::MutationReply* response) {
  auto result =
      registry_.set_cooldown(request->account(), request->duration_hours());
  populate_mutation_reply(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetAccount(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::GetAccountRequest* request,
    guardrail::rpc::v1::AccountReply* response) {
  auto record = registry_.get_account(request->account());
  response->set_found(record.has_value());
  if (record.has_value()) {
    populate_record(*record, response->mutable_record());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetHistory(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::GetHistoryRequest* request,
    guardrail::rpc::v1::HistoryReply* response) {
  auto entries = registry_.history(request->account(),
                                   request->from_sequence(), request->limit());
  for (const auto& entry : entries) {
    populate_entry(entry, response->add_entries());
  }
  spdlog::debug("History for '{}' returned {} entries", request->account(),
                entries.size());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetAttestorKey(
    grpc::CallbackServerContext* context,
    const guardrail::rpc::v1::GetAttestorKeyRequest*,
    guardrail::rpc::v1::AttestorKeyReply* response) {
  response->set_public_key_hex(to_hex(registry_.attestor_public_key()));
  auto prefix = registry_.network_prefix();
  if (prefix.has_value()) {
    response->set_network_prefix(std::string(1, *prefix));
  }
  return finish_ok(context);
}
