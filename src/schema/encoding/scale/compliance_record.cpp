#include <guardrail/schema/encoding/scale/compliance_record.hpp>

#include <iterator>
#include <vector>

namespace guardrail::schema {

void encode(const compliance_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account, encoder);
  encode(o.age_verified, encoder);
  encode(o.daily_limit, encoder);
  encode(o.monthly_limit, encoder);
  encode(o.daily_spent, encoder);
  encode(o.monthly_spent, encoder);
  encode(o.last_reset_day, encoder);
  encode(o.last_reset_month, encoder);
  encode(o.cooldown_until, encoder);
  encode(o.self_excluded_until, encoder);
  // Sorted set order keeps the encoding deterministic.
  auto platforms = std::vector<platform_id_t>{std::begin(o.platforms_used),
                                              std::end(o.platforms_used)};
  encode(platforms, encoder);
  encode(o.registered_at, encoder);
  encode(o.audit_sequence, encoder);
  encode(o.audit_root, encoder);
}

void decode(compliance_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account, decoder);
  decode(o.age_verified, decoder);
  decode(o.daily_limit, decoder);
  decode(o.monthly_limit, decoder);
  decode(o.daily_spent, decoder);
  decode(o.monthly_spent, decoder);
  decode(o.last_reset_day, decoder);
  decode(o.last_reset_month, decoder);
  decode(o.cooldown_until, decoder);
  decode(o.self_excluded_until, decoder);
  auto platforms = std::vector<platform_id_t>{};
  decode(platforms, decoder);
  o.platforms_used = {std::begin(platforms), std::end(platforms)};
  decode(o.registered_at, decoder);
  decode(o.audit_sequence, decoder);
  decode(o.audit_root, decoder);
}

}  // namespace guardrail::schema
