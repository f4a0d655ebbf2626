#pragma once

#include <schemata/schema/owned_state_schema.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             owned_state_kind,
                             schemata::schema::owned_state_kind::declarative,
                             schemata::schema::owned_state_kind::fungible,
                             schemata::schema::owned_state_kind::structured,
                             schemata::schema::owned_state_kind::attachment)

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             fungible_type,
                             schemata::schema::fungible_type::unsigned_64bit)
