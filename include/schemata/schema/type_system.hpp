#pragma once
#include <schemata/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: type system.
// Name -> semantic type id lookup the schema draws its field types from.
namespace schemata::schema {

struct type_entry_t final {
  // Qualified name, e.g. "ContractStd.Amount".
  std::string name;
  // Canonical layout description the semantic id commits to.
  std::string layout;
  sem_id_t sem_id{};

  bool operator==(const type_entry_t&) const = default;
};

template <uint16_t Version>
struct type_system;

template <>
struct type_system<1> final {
  uint16_t version{1};
  // must be sorted by name, unique
  std::vector<type_entry_t> types;

  bool operator==(const type_system&) const = default;
};

using type_system_t = type_system<1>;

// Computes semantic ids and sorts entries; later duplicates of a name are
// dropped.
type_system_t make_type_system(
    const std::vector<std::pair<std::string, std::string>>& definitions);

// Merges two systems; entries of `extra` with a name already present in
// `base` are ignored.
type_system_t merge_type_systems(const type_system_t& base,
                                 const type_system_t& extra);

std::optional<sem_id_t> find_type(const type_system_t& types,
                                  std::string_view name);

}  // namespace schemata::schema
