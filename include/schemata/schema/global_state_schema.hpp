#pragma once
#include <schemata/schema/primitives.hpp>

#include <cstdint>

// Schema type: global state schema.
// Contract-level field declaration: a semantic type and how many values the
// contract may hold for it.
namespace schemata::schema {

struct global_state_schema_t final {
  sem_id_t sem_id{};
  uint16_t max_items{1};

  bool operator==(const global_state_schema_t&) const = default;
};

inline global_state_schema_t global_state_once(const sem_id_t& sem_id) {
  return global_state_schema_t{.sem_id = sem_id, .max_items = 1};
}

inline global_state_schema_t global_state_many(const sem_id_t& sem_id,
                                               const uint16_t max_items) {
  return global_state_schema_t{.sem_id = sem_id, .max_items = max_items};
}

inline bool is_multiple(const global_state_schema_t& schema) {
  return schema.max_items > 1;
}

}  // namespace schemata::schema
