#pragma once

#include <guardrail/schema/audit_entry.hpp>
#include <guardrail/schema/encoding/scale/operation_type.hpp>
#include <scale/scale.hpp>

namespace guardrail::schema {

void encode(const audit_entry<1>& o, ::scale::Encoder& encoder);
void decode(audit_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace guardrail::schema
