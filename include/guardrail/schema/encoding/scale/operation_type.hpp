#pragma once

#include <guardrail/schema/operation_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(guardrail::schema,
                             operation_type_t,
                             guardrail::schema::operation_type_t::register_user,
                             guardrail::schema::operation_type_t::set_limits,
                             guardrail::schema::operation_type_t::record_transaction,
                             guardrail::schema::operation_type_t::self_exclude,
                             guardrail::schema::operation_type_t::set_cooldown)
