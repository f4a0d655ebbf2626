#pragma once
#include <schemata/isa/opcode.hpp>
#include <schemata/schema/iface_impl.hpp>
#include <schemata/schema/library.hpp>
#include <schemata/schema/schema.hpp>
#include <schemata/schema/type_system.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// Schema type: package.
// Publishable artifact: schema, its interface binding, the types it draws
// from and every library its validators point into.
namespace schemata::schema {

// Opcode each validator has to start with. Carried next to the schema, not
// inside it, so the schema id does not depend on it.
struct validator_opcodes_t final {
  std::optional<schemata::isa::opcode_t> genesis;
  // sorted by transition type, unique
  std::vector<std::pair<transition_type_t, schemata::isa::opcode_t>>
      transitions;

  bool operator==(const validator_opcodes_t&) const = default;
};

template <uint16_t Version>
struct package;

template <>
struct package<1> final {
  uint16_t version{1};
  schema_t schema;
  iface_impl_t iface_impl;
  type_system_t types;
  // sorted by library id, at most one entry per id
  std::vector<library_t> scripts;
  validator_opcodes_t validator_opcodes;

  bool operator==(const package&) const = default;
};

using package_t = package<1>;

}  // namespace schemata::schema
