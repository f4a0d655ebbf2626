#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <schemata/builder/schema_builder.hpp>
#include <schemata/isa/offset_table.hpp>
#include <schemata/schema/identity.hpp>

#include <algorithm>
#include <initializer_list>
#include <iterator>

using namespace schemata::schema;

namespace schemata::builder {

namespace {

using occurrence_map_t = std::vector<std::pair<uint16_t, occurrences_t>>;

template <typename Id, typename T>
bool insert_sorted(std::vector<std::pair<Id, T>>& entries,
                   const Id id,
                   T value) {
  auto it = std::lower_bound(
      std::begin(entries), std::end(entries), id,
      [](const auto& entry, const Id key) { return entry.first < key; });
  if (it != std::end(entries) && it->first == id) {
    return false;
  }
  entries.insert(it, std::pair<Id, T>{id, std::move(value)});
  return true;
}

// Sorts a rule's occurrence list and clears bounds the kinds ignore;
// returns the first duplicated id, if any.
std::optional<uint16_t> normalize(occurrence_map_t& occurrences) {
  for (auto& [id, rule] : occurrences) {
    rule = normalized(rule);
  }
  std::stable_sort(
      std::begin(occurrences), std::end(occurrences),
      [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
  auto it = std::adjacent_find(
      std::begin(occurrences), std::end(occurrences),
      [](const auto& lhs, const auto& rhs) { return lhs.first == rhs.first; });
  if (it != std::end(occurrences)) {
    return it->first;
  }
  return std::nullopt;
}

std::optional<uint16_t> find_unsatisfiable(
    const occurrence_map_t& occurrences) {
  for (const auto& [id, rule] : occurrences) {
    if (!is_satisfiable(rule)) {
      return id;
    }
  }
  return std::nullopt;
}

build_result<bool> check_globals(const schema_t& schema,
                                 const occurrence_map_t& globals,
                                 const std::string_view rule) {
  for (const auto& [id, occurrences] : globals) {
    if (find_global_type(schema, id) == nullptr) {
      return make_build_failure<bool>(
          build_error_code::unknown_global_state,
          fmt::format("{} references undeclared global state {}", rule, id));
    }
  }
  return make_build_success(true);
}

build_result<bool> check_owned(const schema_t& schema,
                               const occurrence_map_t& owned,
                               const std::string_view rule) {
  for (const auto& [id, occurrences] : owned) {
    if (find_owned_type(schema, id) == nullptr) {
      return make_build_failure<bool>(
          build_error_code::unknown_owned_state,
          fmt::format("{} references undeclared owned state {}", rule, id));
    }
  }
  return make_build_success(true);
}

build_result<bool> check_validator(
    const std::optional<lib_site_t>& validator,
    const std::optional<schemata::isa::opcode_t>& required,
    const std::vector<library_t>& scripts,
    const std::string_view rule) {
  if (!validator) {
    if (required) {
      return make_build_failure<bool>(
          build_error_code::validator_opcode_mismatch,
          fmt::format("{} requires a '{}' validator but declares none", rule,
                      schemata::isa::to_string(*required)));
    }
    return make_build_success(true);
  }
  auto it = std::find_if(std::begin(scripts), std::end(scripts),
                         [&](const auto& library) {
                           return library_id(library) == validator->library_id;
                         });
  if (it == std::end(scripts)) {
    return make_build_failure<bool>(
        build_error_code::missing_library,
        fmt::format("{} validator points into library {} which is not in "
                    "the script set",
                    rule, to_hex(validator->library_id)));
  }
  auto site = schemata::isa::verify_site(*it, validator->offset, required);
  if (!site) {
    return make_build_failure<bool>(
        site.code, fmt::format("{} validator: {}", rule, site.info));
  }
  return make_build_success(true);
}

}  // namespace

schema_builder::schema_builder(std::string name, identity_t developer) {
  schema_.name = std::move(name);
  schema_.developer = std::move(developer);
}

schema_builder& schema_builder::add_global_state(
    const global_state_type_t id,
    global_state_schema_t global) {
  if (!failed() && !insert_sorted(schema_.global_types, id, std::move(global))) {
    record_error(build_error_code::duplicate_global_state,
                 fmt::format("global state {} declared twice", id));
  }
  return *this;
}

schema_builder& schema_builder::add_global_state(
    const global_state_type_t id,
    const type_system_t& types,
    const std::string_view type_name,
    const uint16_t max_items) {
  if (failed()) {
    return *this;
  }
  auto sem_id = find_type(types, type_name);
  if (!sem_id) {
    record_error(build_error_code::unknown_type,
                 fmt::format("global state {} uses unknown type '{}'", id,
                             type_name));
    return *this;
  }
  return add_global_state(id, global_state_many(*sem_id, max_items));
}

schema_builder& schema_builder::add_owned_state(const assignment_type_t id,
                                                owned_state_schema_t owned) {
  if (!failed() && !insert_sorted(schema_.owned_types, id, std::move(owned))) {
    record_error(build_error_code::duplicate_owned_state,
                 fmt::format("owned state {} declared twice", id));
  }
  return *this;
}

schema_builder& schema_builder::set_genesis(genesis_schema_t genesis) {
  if (failed()) {
    return *this;
  }
  if (has_genesis_) {
    record_error(build_error_code::duplicate_genesis,
                 "genesis declared twice");
    return *this;
  }
  if (auto dup = normalize(genesis.globals)) {
    record_error(build_error_code::duplicate_global_state,
                 fmt::format("genesis lists global state {} twice", *dup));
    return *this;
  }
  if (auto dup = normalize(genesis.assignments)) {
    record_error(build_error_code::duplicate_owned_state,
                 fmt::format("genesis lists owned state {} twice", *dup));
    return *this;
  }
  for (const auto* rules : {&genesis.globals, &genesis.assignments}) {
    if (auto slot = find_unsatisfiable(*rules)) {
      record_error(build_error_code::unsatisfiable_occurrences,
                   fmt::format("genesis rule for slot {} can never be met",
                               *slot));
      return *this;
    }
  }
  schema_.genesis = std::move(genesis);
  has_genesis_ = true;
  return *this;
}

schema_builder& schema_builder::add_transition(
    const transition_type_t id,
    transition_schema_t transition) {
  if (failed()) {
    return *this;
  }
  if (auto dup = normalize(transition.globals)) {
    record_error(build_error_code::duplicate_global_state,
                 fmt::format("transition {} lists global state {} twice", id,
                             *dup));
    return *this;
  }
  if (auto dup = normalize(transition.inputs)) {
    record_error(build_error_code::duplicate_owned_state,
                 fmt::format("transition {} lists input {} twice", id, *dup));
    return *this;
  }
  if (auto dup = normalize(transition.assignments)) {
    record_error(build_error_code::duplicate_owned_state,
                 fmt::format("transition {} lists assignment {} twice", id,
                             *dup));
    return *this;
  }
  for (const auto* rules :
       {&transition.globals, &transition.inputs, &transition.assignments}) {
    if (auto slot = find_unsatisfiable(*rules)) {
      record_error(build_error_code::unsatisfiable_occurrences,
                   fmt::format("transition {} rule for slot {} can never be "
                               "met",
                               id, *slot));
      return *this;
    }
  }
  if (!insert_sorted(schema_.transitions, id, std::move(transition))) {
    record_error(build_error_code::duplicate_transition,
                 fmt::format("transition {} declared twice", id));
  }
  return *this;
}

schema_builder& schema_builder::require_genesis_opcode(
    const schemata::isa::opcode_t opcode) {
  opcodes_.genesis = opcode;
  return *this;
}

schema_builder& schema_builder::require_transition_opcode(
    const transition_type_t id,
    const schemata::isa::opcode_t opcode) {
  auto& transitions = opcodes_.transitions;
  auto it = std::lower_bound(
      std::begin(transitions), std::end(transitions), id,
      [](const auto& entry, const transition_type_t key) {
        return entry.first < key;
      });
  if (it != std::end(transitions) && it->first == id) {
    it->second = opcode;
  } else {
    transitions.emplace(it, id, opcode);
  }
  return *this;
}

build_result<schema_t> schema_builder::build(
    const std::vector<library_t>& scripts) const {
  auto reject = [&](const build_error_code code, const std::string& info) {
    spdlog::warn("Schema '{}' rejected: {} ({})", schema_.name,
                 to_string(code), info);
    return make_build_failure<schema_t>(code, info);
  };

  if (failed()) {
    return reject(error_, error_info_);
  }
  if (!has_genesis_) {
    return reject(build_error_code::missing_genesis, "no genesis declared");
  }

  auto checks = std::vector<build_result<bool>>{};
  checks.push_back(check_globals(schema_, schema_.genesis.globals, "genesis"));
  checks.push_back(
      check_owned(schema_, schema_.genesis.assignments, "genesis"));
  checks.push_back(check_validator(schema_.genesis.validator, opcodes_.genesis,
                                   scripts, "genesis"));
  for (const auto& [id, transition] : schema_.transitions) {
    auto rule = fmt::format("transition {}", id);
    auto required = std::optional<schemata::isa::opcode_t>{};
    for (const auto& [transition_id, opcode] : opcodes_.transitions) {
      if (transition_id == id) {
        required = opcode;
      }
    }
    checks.push_back(check_globals(schema_, transition.globals, rule));
    checks.push_back(check_owned(schema_, transition.inputs, rule));
    checks.push_back(check_owned(schema_, transition.assignments, rule));
    checks.push_back(
        check_validator(transition.validator, required, scripts, rule));
  }
  for (const auto& [id, opcode] : opcodes_.transitions) {
    if (find_transition(schema_, id) == nullptr) {
      checks.push_back(make_build_failure<bool>(
          build_error_code::validator_opcode_mismatch,
          fmt::format("opcode required for undeclared transition {}", id)));
    }
  }
  for (const auto& check : checks) {
    if (!check) {
      return reject(check.code, check.info);
    }
  }

  spdlog::debug("Built schema '{}' {}", schema_.name,
                to_hex(schema_id(schema_)));
  return make_build_success(schema_);
}

void schema_builder::record_error(const build_error_code code,
                                  std::string info) {
  if (failed()) {
    return;
  }
  error_ = code;
  error_info_ = std::move(info);
}

}  // namespace schemata::builder
