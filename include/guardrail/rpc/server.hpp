#pragma once

#include <guardrail/rpc/v1/registry.grpc.pb.h>
#include <guardrail/execution/registry.hpp>

namespace guardrail::rpc {

/// Registry gRPC service for operator platforms.
///
/// Every handler completes inline on the callback thread; policy and
/// validation failures travel in the reply, so the gRPC status is OK whenever
/// the registry decided the request.
struct listener final : public guardrail::rpc::v1::Registry::CallbackService {
  /// Bind listener to registry instance.
  explicit listener(guardrail::execution::registry& registry);

  virtual grpc::ServerUnaryReactor* RegisterUser(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::RegisterUserRequest* request,
      guardrail::rpc::v1::MutationReply* response) override final;

  virtual grpc::ServerUnaryReactor* SetLimits(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::SetLimitsRequest* request,
      guardrail::rpc::v1::MutationReply* response) override final;

  virtual grpc::ServerUnaryReactor* CheckEligibility(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::CheckEligibilityRequest* request,
      guardrail::rpc::v1::EligibilityReply* response) override final;

  virtual grpc::ServerUnaryReactor* RecordTransaction(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::RecordTransactionRequest* request,
      guardrail::rpc::v1::MutationReply* response) override final;

  virtual grpc::ServerUnaryReactor* SelfExclude(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::SelfExcludeRequest* request,
      guardrail::rpc::v1::MutationReply* response) override final;

  virtual grpc::ServerUnaryReactor* SetCooldown(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::SetCooldownRequest* request,
      guardrail::rpc::v1::MutationReply* response) override final;

  /// Record snapshot with pending window resets applied.
  virtual grpc::ServerUnaryReactor* GetAccount(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::GetAccountRequest* request,
      guardrail::rpc::v1::AccountReply* response) override final;

  virtual grpc::ServerUnaryReactor* GetHistory(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::GetHistoryRequest* request,
      guardrail::rpc::v1::HistoryReply* response) override final;

  virtual grpc::ServerUnaryReactor* GetAttestorKey(
      grpc::CallbackServerContext* context,
      const guardrail::rpc::v1::GetAttestorKeyRequest* request,
      guardrail::rpc::v1::AttestorKeyReply* response) override final;

 private:
  guardrail::execution::registry& registry_;
};

}  // namespace guardrail::rpc
