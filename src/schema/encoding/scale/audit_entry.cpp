#include <guardrail/schema/encoding/scale/audit_entry.hpp>

namespace guardrail::schema {

void encode(const audit_entry<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.timestamp, encoder);
  encode(o.operation, encoder);
  encode(o.amount, encoder);
  encode(o.secondary_amount, encoder);
  encode(o.platform_id, encoder);
  encode(o.previous_root, encoder);
  encode(o.root, encoder);
}

void decode(audit_entry<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.timestamp, decoder);
  decode(o.operation, decoder);
  decode(o.amount, decoder);
  decode(o.secondary_amount, decoder);
  decode(o.platform_id, decoder);
  decode(o.previous_root, decoder);
  decode(o.root, decoder);
}

}  // namespace guardrail::schema
