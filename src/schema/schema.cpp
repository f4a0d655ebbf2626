#include <schemata/schema/schema.hpp>

#include <algorithm>

namespace schemata::schema {

namespace {

template <typename Id, typename T>
const T* find_sorted(const std::vector<std::pair<Id, T>>& entries,
                     const Id id) {
  auto it = std::lower_bound(
      std::begin(entries), std::end(entries), id,
      [](const auto& entry, const Id key) { return entry.first < key; });
  if (it == std::end(entries) || it->first != id) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace

const global_state_schema_t* find_global_type(const schema_t& schema,
                                              const global_state_type_t id) {
  return find_sorted(schema.global_types, id);
}

const owned_state_schema_t* find_owned_type(const schema_t& schema,
                                            const assignment_type_t id) {
  return find_sorted(schema.owned_types, id);
}

const transition_schema_t* find_transition(const schema_t& schema,
                                           const transition_type_t id) {
  return find_sorted(schema.transitions, id);
}

std::vector<lib_site_t> validator_sites(const schema_t& schema) {
  auto sites = std::vector<lib_site_t>{};
  if (schema.genesis.validator) {
    sites.push_back(*schema.genesis.validator);
  }
  for (const auto& [id, transition] : schema.transitions) {
    if (transition.validator) {
      sites.push_back(*transition.validator);
    }
  }
  return sites;
}

}  // namespace schemata::schema
