#pragma once
#include <schemata/schema/library.hpp>
#include <schemata/schema/occurrences.hpp>
#include <schemata/schema/primitives.hpp>

#include <optional>
#include <utility>
#include <vector>

// Schema type: genesis schema.
// Contract creation rule.
namespace schemata::schema {

struct genesis_schema_t final {
  // must be sorted by slot id, unique
  std::vector<std::pair<global_state_type_t, occurrences_t>> globals;
  // must be sorted by slot id, unique
  std::vector<std::pair<assignment_type_t, occurrences_t>> assignments;
  std::optional<lib_site_t> validator;

  bool operator==(const genesis_schema_t&) const = default;
};

}  // namespace schemata::schema
