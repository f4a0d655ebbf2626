#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <schemata/builder/iface_impl_builder.hpp>
#include <schemata/schema/identity.hpp>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <set>
#include <tuple>

using namespace schemata::schema;

namespace schemata::builder {

namespace {

using impl_result_t = build_result<iface_impl_t>;

template <typename Field>
const Field* find_field(const std::vector<Field>& fields,
                        const std::string_view name) {
  auto it = std::find_if(std::begin(fields), std::end(fields),
                         [&](const auto& field) { return field.name == name; });
  return it == std::end(fields) ? nullptr : &*it;
}

std::optional<impl_result_t> check_unique(
    const std::vector<named_field_t>& fields,
    const std::string_view category) {
  auto ids = std::set<uint16_t>{};
  auto names = std::set<std::string>{};
  for (const auto& field : fields) {
    if (!ids.insert(field.id).second) {
      return make_build_failure<iface_impl_t>(
          build_error_code::duplicate_binding,
          fmt::format("{} id {} bound twice", category, field.id));
    }
    if (!names.insert(field.name).second) {
      return make_build_failure<iface_impl_t>(
          build_error_code::duplicate_binding,
          fmt::format("{} name '{}' bound twice", category, field.name));
    }
  }
  return std::nullopt;
}

template <typename Field>
std::optional<impl_result_t> check_required(
    const std::vector<Field>& expected,
    const std::vector<named_field_t>& bound,
    const std::string_view category) {
  for (const auto& field : expected) {
    if (!field.required) {
      continue;
    }
    auto mapped = std::any_of(
        std::begin(bound), std::end(bound),
        [&](const auto& named) { return named.name == field.name; });
    if (!mapped) {
      return make_build_failure<iface_impl_t>(
          build_error_code::interface_category_missing,
          fmt::format("interface requires {} '{}' which the schema does not "
                      "provide",
                      category, field.name));
    }
  }
  return std::nullopt;
}

std::optional<impl_result_t> check_global_state(
    const schema_t& schema,
    const iface_t& iface,
    const std::vector<named_field_t>& fields) {
  for (const auto& field : fields) {
    const auto* global = find_global_type(schema, field.id);
    if (global == nullptr) {
      return make_build_failure<iface_impl_t>(
          build_error_code::unknown_binding_id,
          fmt::format("global state {} ('{}') is not in the schema", field.id,
                      field.name));
    }
    const auto* expected = find_field(iface.global_state, field.name);
    if (expected == nullptr) {
      return make_build_failure<iface_impl_t>(
          build_error_code::unknown_interface_field,
          fmt::format("interface has no global state '{}'", field.name));
    }
    if (expected->multiple != is_multiple(*global)) {
      return make_build_failure<iface_impl_t>(
          build_error_code::interface_shape_mismatch,
          fmt::format("global state '{}' is {} in the interface but holds up "
                      "to {} item(s) in the schema",
                      field.name, expected->multiple ? "multiple" : "single",
                      global->max_items));
    }
    if (expected->sem_id && *expected->sem_id != global->sem_id) {
      return make_build_failure<iface_impl_t>(
          build_error_code::interface_shape_mismatch,
          fmt::format("global state '{}' has type {} but the interface "
                      "expects {}",
                      field.name, to_hex(global->sem_id),
                      to_hex(*expected->sem_id)));
    }
  }
  return std::nullopt;
}

std::optional<impl_result_t> check_assignments(
    const schema_t& schema,
    const iface_t& iface,
    const std::vector<named_field_t>& fields) {
  for (const auto& field : fields) {
    const auto* owned = find_owned_type(schema, field.id);
    if (owned == nullptr) {
      return make_build_failure<iface_impl_t>(
          build_error_code::unknown_binding_id,
          fmt::format("owned state {} ('{}') is not in the schema", field.id,
                      field.name));
    }
    const auto* expected = find_field(iface.assignments, field.name);
    if (expected == nullptr) {
      return make_build_failure<iface_impl_t>(
          build_error_code::unknown_interface_field,
          fmt::format("interface has no assignment '{}'", field.name));
    }
    if (expected->kind != owned->kind) {
      return make_build_failure<iface_impl_t>(
          build_error_code::interface_shape_mismatch,
          fmt::format("assignment '{}' is {} in the interface but {} in the "
                      "schema",
                      field.name, to_string(expected->kind),
                      to_string(owned->kind)));
    }
  }
  return std::nullopt;
}

std::optional<impl_result_t> check_transitions(
    const schema_t& schema,
    const iface_t& iface,
    const std::vector<named_field_t>& fields) {
  for (const auto& field : fields) {
    if (find_transition(schema, field.id) == nullptr) {
      return make_build_failure<iface_impl_t>(
          build_error_code::unknown_binding_id,
          fmt::format("transition {} ('{}') is not in the schema", field.id,
                      field.name));
    }
    if (find_field(iface.transitions, field.name) == nullptr) {
      return make_build_failure<iface_impl_t>(
          build_error_code::unknown_interface_field,
          fmt::format("interface has no transition '{}'", field.name));
    }
  }
  return std::nullopt;
}

std::vector<named_field_t> sorted(std::vector<named_field_t> fields) {
  std::sort(std::begin(fields), std::end(fields),
            [](const auto& lhs, const auto& rhs) {
              return std::tie(lhs.id, lhs.name) < std::tie(rhs.id, rhs.name);
            });
  return fields;
}

}  // namespace

iface_impl_builder::iface_impl_builder(schema_t schema, iface_t iface)
    : schema_(std::move(schema)),
      iface_(std::move(iface)),
      developer_(schema_.developer) {}

iface_impl_builder& iface_impl_builder::developer(identity_t developer) {
  developer_ = std::move(developer);
  return *this;
}

iface_impl_builder& iface_impl_builder::timestamp(
    const timestamp_seconds_t seconds) {
  timestamp_ = seconds;
  return *this;
}

iface_impl_builder& iface_impl_builder::version(const ver_no_t version) {
  version_ = version;
  return *this;
}

iface_impl_builder& iface_impl_builder::map_global_state(
    const global_state_type_t id,
    std::string name) {
  global_state_.push_back(named_field_t{.id = id, .name = std::move(name)});
  return *this;
}

iface_impl_builder& iface_impl_builder::map_assignment(
    const assignment_type_t id,
    std::string name) {
  assignments_.push_back(named_field_t{.id = id, .name = std::move(name)});
  return *this;
}

iface_impl_builder& iface_impl_builder::map_transition(
    const transition_type_t id,
    std::string name) {
  transitions_.push_back(named_field_t{.id = id, .name = std::move(name)});
  return *this;
}

build_result<iface_impl_t> iface_impl_builder::build() const {
  auto failures = std::vector<std::optional<impl_result_t>>{
      check_unique(global_state_, "global state"),
      check_unique(assignments_, "assignment"),
      check_unique(transitions_, "transition"),
      check_global_state(schema_, iface_, global_state_),
      check_assignments(schema_, iface_, assignments_),
      check_transitions(schema_, iface_, transitions_),
      check_required(iface_.global_state, global_state_, "global state"),
      check_required(iface_.assignments, assignments_, "assignment"),
      check_required(iface_.transitions, transitions_, "transition"),
  };
  for (const auto& failure : failures) {
    if (failure) {
      spdlog::warn("Binding of '{}' to '{}' rejected: {} ({})", schema_.name,
                   iface_.name, failure->log, failure->info);
      return *failure;
    }
  }

  auto impl = iface_impl_t{};
  impl.version = version_;
  impl.schema_id = schema_id(schema_);
  impl.iface_id = iface_id(iface_);
  impl.timestamp = timestamp_.value_or(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  impl.developer = developer_;
  impl.global_state = sorted(global_state_);
  impl.assignments = sorted(assignments_);
  impl.transitions = sorted(transitions_);

  spdlog::debug("Bound schema '{}' to interface '{}' at {}", schema_.name,
                iface_.name, impl.timestamp);
  return make_build_success(std::move(impl));
}

}  // namespace schemata::builder
