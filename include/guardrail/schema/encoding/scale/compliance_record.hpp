#pragma once

#include <guardrail/schema/compliance_record.hpp>
#include <scale/scale.hpp>

// Found by argument-dependent lookup from the SCALE codec.
namespace guardrail::schema {

void encode(const compliance_record<1>& o, ::scale::Encoder& encoder);
void decode(compliance_record<1>& o, ::scale::Decoder& decoder);

}  // namespace guardrail::schema
