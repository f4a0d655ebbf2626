#pragma once
#include <schemata/schema/iface.hpp>
#include <schemata/schema/library.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/schema.hpp>

#include <string>
#include <string_view>

// Content addressing: every id is BLAKE3(tag || SCALE(record)).
namespace schemata::schema {

inline constexpr auto kLibraryIdTag = std::string_view{"urn:schemata:library#v1"};
inline constexpr auto kSchemaIdTag = std::string_view{"urn:schemata:schema#v1"};
inline constexpr auto kIfaceIdTag = std::string_view{"urn:schemata:iface#v1"};
inline constexpr auto kSemIdTag = std::string_view{"urn:schemata:type#v1"};

library_id_t library_id(const library_t& library);
schema_id_t schema_id(const schema_t& schema);
iface_id_t iface_id(const iface_t& iface);
sem_id_t sem_id(std::string_view name, std::string_view layout);

}  // namespace schemata::schema
