#include <schemata/schema/identity.hpp>
#include <schemata/schema/type_system.hpp>

#include <algorithm>

namespace schemata::schema {

namespace {

void sort_and_unique(std::vector<type_entry_t>& types) {
  std::stable_sort(
      std::begin(types), std::end(types),
      [](const auto& lhs, const auto& rhs) { return lhs.name < rhs.name; });
  auto last = std::unique(
      std::begin(types), std::end(types),
      [](const auto& lhs, const auto& rhs) { return lhs.name == rhs.name; });
  types.erase(last, std::end(types));
}

}  // namespace

type_system_t make_type_system(
    const std::vector<std::pair<std::string, std::string>>& definitions) {
  auto types = type_system_t{};
  types.types.reserve(definitions.size());
  for (const auto& [name, layout] : definitions) {
    types.types.push_back(type_entry_t{
        .name = name, .layout = layout, .sem_id = sem_id(name, layout)});
  }
  sort_and_unique(types.types);
  return types;
}

type_system_t merge_type_systems(const type_system_t& base,
                                 const type_system_t& extra) {
  auto merged = base;
  merged.types.insert(std::end(merged.types), std::begin(extra.types),
                      std::end(extra.types));
  sort_and_unique(merged.types);
  return merged;
}

std::optional<sem_id_t> find_type(const type_system_t& types,
                                  const std::string_view name) {
  auto it = std::lower_bound(
      std::begin(types.types), std::end(types.types), name,
      [](const auto& entry, const std::string_view key) {
        return entry.name < key;
      });
  if (it == std::end(types.types) || it->name != name) {
    return std::nullopt;
  }
  return it->sem_id;
}

}  // namespace schemata::schema
