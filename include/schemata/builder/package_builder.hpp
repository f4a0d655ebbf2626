#pragma once
#include <schemata/schema/build_result.hpp>
#include <schemata/schema/iface_impl.hpp>
#include <schemata/schema/library.hpp>
#include <schemata/schema/package.hpp>
#include <schemata/schema/schema.hpp>
#include <schemata/schema/type_system.hpp>

#include <vector>

namespace schemata::builder {

/// Keyed by library id, sorted, one copy per distinct library.
std::vector<schemata::schema::library_t> make_script_set(
    std::vector<schemata::schema::library_t> libraries);

/// Bundles the artifacts into a package and validates it. `opcodes` is
/// usually `schema_builder::validator_opcodes()` of the builder that made
/// `schema`.
schemata::schema::build_result<schemata::schema::package_t> make_package(
    schemata::schema::schema_t schema,
    schemata::schema::iface_impl_t iface_impl,
    schemata::schema::type_system_t types,
    std::vector<schemata::schema::library_t> libraries,
    schemata::schema::validator_opcodes_t opcodes = {});

/// Re-checks a package, e.g. one decoded from storage: scripts sorted and
/// unique, binding refers to this schema, global slot types present in the
/// type system, every library decodes and every validator address resolves
/// to an instruction boundary holding the recorded opcode, if any.
schemata::schema::build_result<schemata::schema::package_t> validate_package(
    const schemata::schema::package_t& package);

}  // namespace schemata::builder
