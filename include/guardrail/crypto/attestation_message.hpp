#pragma once

#include <guardrail/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace guardrail::crypto {

/// Leading version character of base58 account addresses on the target
/// network.
inline constexpr char kDefaultNetworkPrefix = '3';

/// Bytes an attestor signs for `account`: the identifier with one leading
/// `network_prefix` character removed when present. Signer and verifier must
/// both derive the message through this function.
guardrail::schema::bytes_view_t make_attestation_message(
    std::string_view account,
    std::optional<char> network_prefix = kDefaultNetworkPrefix);

}  // namespace guardrail::crypto
