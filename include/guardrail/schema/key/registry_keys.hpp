#pragma once

#include <guardrail/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Canonical key prefixes for registry state and the per-account audit trail.
// Account identifiers are hashed so that key length is fixed regardless of
// identifier format.
namespace guardrail::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|"};
inline constexpr std::string_view kAccountHistoryPrefix{
    "SYS|HISTORY|ACCOUNT|"};

inline constexpr std::array<std::string_view, 4> kRegistryKeyspaces{
    kStatePrefix, kAccountKeyPrefix, kHistoryPrefix, kAccountHistoryPrefix};

guardrail::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const guardrail::schema::bytes_view_t& id);

/// SYS|STATE|ACCOUNT|<blake3(account)>
guardrail::schema::bytes_t make_account_key(std::string_view account);

/// SYS|HISTORY|ACCOUNT|<blake3(account)>
guardrail::schema::bytes_t make_account_history_prefix(
    std::string_view account);

/// SYS|HISTORY|ACCOUNT|<blake3(account)><big-endian sequence>
guardrail::schema::bytes_t make_account_history_key(std::string_view account,
                                                    uint64_t sequence);

}  // namespace guardrail::schema::key
