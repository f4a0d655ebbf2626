#pragma once

#include <schemata/builder/schema_builder.hpp>
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/instruction.hpp>
#include <schemata/schema/identity.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/schema.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace schemata::testing {

inline constexpr uint16_t kIssuedSupply = 2002;
inline constexpr uint16_t kAsset = 4000;
inline constexpr uint16_t kTransfer = 10000;

inline schemata::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = schemata::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

// Two-subroutine program: genesis check at 0, transfer check at 6.
inline std::vector<schemata::isa::instruction_t> make_program(
    const uint16_t upper = 4000,
    const uint16_t lower = 2000,
    const uint16_t family = 4000) {
  return {schemata::isa::pccs_t{.upper_bound = upper, .lower_bound = lower},
          schemata::isa::ret_t{},
          schemata::isa::pcvs_t{.family = family}};
}

inline schemata::schema::library_t make_library(
    const uint16_t upper = 4000,
    const uint16_t lower = 2000,
    const uint16_t family = 4000) {
  auto assembly = schemata::isa::assemble(make_program(upper, lower, family));
  return assembly.value.value().library;
}

// Single global slot "issuedSupply" (once), fungible "asset", genesis and
// transfer wired to the library at 0 and 6.
inline schemata::builder::schema_builder make_example_builder(
    const schemata::schema::library_id_t& library_id) {
  using namespace schemata::schema;
  auto builder = schemata::builder::schema_builder{"Example", "ssi:test"};
  builder
      .add_global_state(kIssuedSupply,
                        global_state_once(sem_id("Test.Amount", "u64")))
      .add_owned_state(kAsset, owned_fungible())
      .set_genesis(genesis_schema_t{
          .globals = {{kIssuedSupply, occurs_once()}},
          .assignments = {{kAsset, occurs_once_or_more()}},
          .validator = make_lib_site(library_id, 0)})
      .add_transition(kTransfer,
                      transition_schema_t{
                          .globals = {},
                          .inputs = {{kAsset, occurs_once_or_more()}},
                          .assignments = {{kAsset, occurs_once_or_more()}},
                          .validator = make_lib_site(library_id, 6)});
  return builder;
}

}  // namespace schemata::testing
