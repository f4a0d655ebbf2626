#pragma once

#include <schemata/schema/occurrences.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             occurrences_kind,
                             schemata::schema::occurrences_kind::none_or_once,
                             schemata::schema::occurrences_kind::once,
                             schemata::schema::occurrences_kind::none_or_more,
                             schemata::schema::occurrences_kind::once_or_more,
                             schemata::schema::occurrences_kind::none_or_up_to,
                             schemata::schema::occurrences_kind::once_or_up_to)
