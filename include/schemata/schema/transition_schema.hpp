#pragma once
#include <schemata/schema/library.hpp>
#include <schemata/schema/occurrences.hpp>
#include <schemata/schema/primitives.hpp>

#include <optional>
#include <utility>
#include <vector>

// Schema type: transition schema.
// State transition rule, keyed by transition type in the schema.
namespace schemata::schema {

struct transition_schema_t final {
  std::vector<std::pair<global_state_type_t, occurrences_t>> globals;
  // Owned state consumed by the transition.
  std::vector<std::pair<assignment_type_t, occurrences_t>> inputs;
  // Owned state produced by the transition.
  std::vector<std::pair<assignment_type_t, occurrences_t>> assignments;
  std::optional<lib_site_t> validator;

  bool operator==(const transition_schema_t&) const = default;
};

}  // namespace schemata::schema
