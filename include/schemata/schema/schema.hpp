#pragma once
#include <schemata/schema/genesis_schema.hpp>
#include <schemata/schema/global_state_schema.hpp>
#include <schemata/schema/owned_state_schema.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/transition_schema.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Schema type: schema.
// Declarative shape of a contract type and its validation wiring.
namespace schemata::schema {

template <uint16_t Version>
struct schema;

template <>
struct schema<1> final {
  uint16_t version{1};
  std::string name;
  identity_t developer;
  // All maps below are sorted by id with unique keys.
  std::vector<std::pair<global_state_type_t, global_state_schema_t>>
      global_types;
  std::vector<std::pair<assignment_type_t, owned_state_schema_t>> owned_types;
  genesis_schema_t genesis;
  std::vector<std::pair<transition_type_t, transition_schema_t>> transitions;

  bool operator==(const schema&) const = default;
};

using schema_t = schema<1>;

const global_state_schema_t* find_global_type(const schema_t& schema,
                                              global_state_type_t id);
const owned_state_schema_t* find_owned_type(const schema_t& schema,
                                            assignment_type_t id);
const transition_schema_t* find_transition(const schema_t& schema,
                                           transition_type_t id);

// Validator addresses in declaration order: genesis first, then transitions.
std::vector<lib_site_t> validator_sites(const schema_t& schema);

}  // namespace schemata::schema
