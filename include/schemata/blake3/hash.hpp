#pragma once
#include <schemata/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace schemata::blake3 {

schemata::schema::hash32_t hash(const std::string_view& str);
schemata::schema::hash32_t hash(const schemata::schema::bytes_view_t& bytes);

// Domain separated hash: BLAKE3(tag || bytes).
schemata::schema::hash32_t tagged_hash(
    const std::string_view& tag,
    const schemata::schema::bytes_view_t& bytes);

}  // namespace schemata::blake3
