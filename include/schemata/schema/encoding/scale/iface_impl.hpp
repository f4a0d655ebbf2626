#pragma once

#include <schemata/schema/iface_impl.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             ver_no_t,
                             schemata::schema::ver_no_t::v1)
