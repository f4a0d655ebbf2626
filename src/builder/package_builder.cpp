#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <schemata/builder/package_builder.hpp>
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/offset_table.hpp>
#include <schemata/schema/identity.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>
#include <utility>

using namespace schemata::schema;

namespace schemata::builder {

namespace {

using package_result_t = build_result<package_t>;

std::optional<package_result_t> check_scripts(
    const std::vector<library_t>& scripts) {
  for (std::size_t i = 0; i < scripts.size(); ++i) {
    auto decoded = schemata::isa::disassemble(
        bytes_view_t{scripts[i].code.data(), scripts[i].code.size()});
    if (!decoded) {
      return make_build_failure<package_t>(
          decoded.code, fmt::format("library {}: {}",
                                    to_hex(library_id(scripts[i])),
                                    decoded.info));
    }
    if (i > 0 && !(library_id(scripts[i - 1]) < library_id(scripts[i]))) {
      return make_build_failure<package_t>(
          build_error_code::malformed_script_set,
          "script set is not sorted by library id or holds a duplicate");
    }
  }
  return std::nullopt;
}

std::optional<package_result_t> check_types(const package_t& package) {
  for (const auto& [id, global] : package.schema.global_types) {
    auto present = std::any_of(
        std::begin(package.types.types), std::end(package.types.types),
        [&](const auto& entry) { return entry.sem_id == global.sem_id; });
    if (!present) {
      return make_build_failure<package_t>(
          build_error_code::unknown_type,
          fmt::format("global state {} has type {} missing from the type "
                      "system",
                      id, to_hex(global.sem_id)));
    }
  }
  return std::nullopt;
}

std::optional<package_result_t> check_validator(
    const package_t& package,
    const std::optional<lib_site_t>& validator,
    const std::optional<schemata::isa::opcode_t>& required,
    const std::string_view rule) {
  if (!validator) {
    if (required) {
      return make_build_failure<package_t>(
          build_error_code::validator_opcode_mismatch,
          fmt::format("{} requires a '{}' validator but declares none", rule,
                      schemata::isa::to_string(*required)));
    }
    return std::nullopt;
  }
  auto it = std::find_if(std::begin(package.scripts),
                         std::end(package.scripts), [&](const auto& library) {
                           return library_id(library) == validator->library_id;
                         });
  if (it == std::end(package.scripts)) {
    return make_build_failure<package_t>(
        build_error_code::missing_library,
        fmt::format("{} validator library {} is not in the package", rule,
                    to_hex(validator->library_id)));
  }
  auto resolved = schemata::isa::verify_site(*it, validator->offset, required);
  if (!resolved) {
    return make_build_failure<package_t>(
        resolved.code, fmt::format("{} validator: {}", rule, resolved.info));
  }
  return std::nullopt;
}

std::optional<package_result_t> check_validators(const package_t& package) {
  const auto& opcodes = package.validator_opcodes;
  auto sorted = std::adjacent_find(
      std::begin(opcodes.transitions), std::end(opcodes.transitions),
      [](const auto& lhs, const auto& rhs) { return !(lhs.first < rhs.first); });
  if (sorted != std::end(opcodes.transitions)) {
    return make_build_failure<package_t>(
        build_error_code::validator_opcode_mismatch,
        "transition opcode requirements are not sorted or hold a duplicate");
  }
  for (const auto& [id, opcode] : opcodes.transitions) {
    if (find_transition(package.schema, id) == nullptr) {
      return make_build_failure<package_t>(
          build_error_code::validator_opcode_mismatch,
          fmt::format("opcode required for undeclared transition {}", id));
    }
  }

  if (auto failure = check_validator(package, package.schema.genesis.validator,
                                     opcodes.genesis, "genesis")) {
    return failure;
  }
  for (const auto& [id, transition] : package.schema.transitions) {
    auto required = std::optional<schemata::isa::opcode_t>{};
    auto it = std::lower_bound(
        std::begin(opcodes.transitions), std::end(opcodes.transitions), id,
        [](const auto& entry, const transition_type_t key) {
          return entry.first < key;
        });
    if (it != std::end(opcodes.transitions) && it->first == id) {
      required = it->second;
    }
    if (auto failure =
            check_validator(package, transition.validator, required,
                            fmt::format("transition {}", id))) {
      return failure;
    }
  }
  return std::nullopt;
}

}  // namespace

std::vector<library_t> make_script_set(std::vector<library_t> libraries) {
  auto keyed = std::vector<std::pair<library_id_t, library_t>>{};
  keyed.reserve(libraries.size());
  for (auto& library : libraries) {
    auto id = library_id(library);
    keyed.emplace_back(id, std::move(library));
  }
  std::sort(std::begin(keyed), std::end(keyed),
            [](const auto& lhs, const auto& rhs) {
              return lhs.first < rhs.first;
            });
  auto last = std::unique(
      std::begin(keyed), std::end(keyed),
      [](const auto& lhs, const auto& rhs) { return lhs.first == rhs.first; });
  keyed.erase(last, std::end(keyed));

  auto scripts = std::vector<library_t>{};
  scripts.reserve(keyed.size());
  for (auto& [id, library] : keyed) {
    scripts.push_back(std::move(library));
  }
  return scripts;
}

build_result<package_t> make_package(schema_t schema,
                                     iface_impl_t iface_impl,
                                     type_system_t types,
                                     std::vector<library_t> libraries,
                                     validator_opcodes_t opcodes) {
  auto package = package_t{};
  package.schema = std::move(schema);
  package.iface_impl = std::move(iface_impl);
  package.types = std::move(types);
  package.scripts = make_script_set(std::move(libraries));
  package.validator_opcodes = std::move(opcodes);
  return validate_package(package);
}

build_result<package_t> validate_package(const package_t& package) {
  auto id = schema_id(package.schema);
  auto failure = std::optional<package_result_t>{};
  if (package.iface_impl.schema_id != id) {
    failure = make_build_failure<package_t>(
        build_error_code::schema_id_mismatch,
        fmt::format("binding refers to schema {} but the package holds {}",
                    to_hex(package.iface_impl.schema_id), to_hex(id)));
  }
  if (!failure) {
    failure = check_scripts(package.scripts);
  }
  if (!failure) {
    failure = check_types(package);
  }
  if (!failure) {
    failure = check_validators(package);
  }
  if (failure) {
    spdlog::warn("Package for schema '{}' rejected: {} ({})",
                 package.schema.name, failure->log, failure->info);
    return *failure;
  }

  spdlog::debug("Package for schema {} holds {} librar{}", to_hex(id),
                package.scripts.size(),
                package.scripts.size() == 1 ? "y" : "ies");
  return make_build_success(package);
}

}  // namespace schemata::builder
