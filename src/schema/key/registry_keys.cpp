#include <guardrail/blake3/hash.hpp>
#include <guardrail/schema/key/builder.hpp>
#include <guardrail/schema/key/registry_keys.hpp>

namespace guardrail::schema::key {

guardrail::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const guardrail::schema::bytes_view_t& id) {
  auto key = builder{};
  key.write(prefix).write(id);
  return key.data;
}

guardrail::schema::bytes_t make_account_key(std::string_view account) {
  auto digest = guardrail::blake3::hash(account);
  return make_prefixed_key(kAccountKeyPrefix, digest);
}

guardrail::schema::bytes_t make_account_history_prefix(
    std::string_view account) {
  auto key = builder{};
  key.write(kAccountHistoryPrefix).hash(account);
  return key.data;
}

guardrail::schema::bytes_t make_account_history_key(std::string_view account,
                                                    uint64_t sequence) {
  auto key = builder{};
  key.write(kAccountHistoryPrefix).hash(account).write_ordered(sequence);
  return key.data;
}

}  // namespace guardrail::schema::key
