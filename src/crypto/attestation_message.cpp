#include <guardrail/crypto/attestation_message.hpp>

namespace guardrail::crypto {

guardrail::schema::bytes_view_t make_attestation_message(
    std::string_view account,
    const std::optional<char> network_prefix) {
  if (network_prefix && !account.empty() && account.front() == *network_prefix) {
    account.remove_prefix(1);
  }
  return guardrail::schema::make_bytes_view(account);
}

}  // namespace guardrail::crypto
