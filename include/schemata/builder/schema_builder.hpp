#pragma once
#include <schemata/isa/opcode.hpp>
#include <schemata/schema/build_result.hpp>
#include <schemata/schema/library.hpp>
#include <schemata/schema/package.hpp>
#include <schemata/schema/schema.hpp>
#include <schemata/schema/type_system.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace schemata::builder {

/// Assembles a schema aggregate.
///
/// Slot and rule insertion never overwrites: a second insertion under the
/// same id is recorded as an error and reported by `build`. The first error
/// wins; later calls are ignored once one is recorded. Entries are kept
/// sorted by id so the resulting schema (and therefore its id) does not
/// depend on insertion order.
class schema_builder final {
 public:
  schema_builder(std::string name, schemata::schema::identity_t developer);

  schema_builder& add_global_state(
      schemata::schema::global_state_type_t id,
      schemata::schema::global_state_schema_t global);

  /// Resolves `type_name` in `types`; an unknown name fails the build with
  /// `unknown_type`.
  schema_builder& add_global_state(schemata::schema::global_state_type_t id,
                                   const schemata::schema::type_system_t& types,
                                   std::string_view type_name,
                                   uint16_t max_items = 1);

  schema_builder& add_owned_state(schemata::schema::assignment_type_t id,
                                  schemata::schema::owned_state_schema_t owned);

  schema_builder& set_genesis(schemata::schema::genesis_schema_t genesis);

  schema_builder& add_transition(
      schemata::schema::transition_type_t id,
      schemata::schema::transition_schema_t transition);

  /// Opcode the genesis validator must start with.
  schema_builder& require_genesis_opcode(schemata::isa::opcode_t opcode);

  /// Opcode the validator of transition `id` must start with.
  schema_builder& require_transition_opcode(
      schemata::schema::transition_type_t id,
      schemata::isa::opcode_t opcode);

  /// Opcode requirements recorded so far, for `make_package`.
  const schemata::schema::validator_opcodes_t& validator_opcodes() const {
    return opcodes_;
  }

  /// Checks slot-reference closure and resolves every validator address
  /// against `scripts`.
  schemata::schema::build_result<schemata::schema::schema_t> build(
      const std::vector<schemata::schema::library_t>& scripts) const;

 private:
  void record_error(schemata::schema::build_error_code code, std::string info);
  bool failed() const {
    return error_ != schemata::schema::build_error_code::ok;
  }

  schemata::schema::schema_t schema_;
  bool has_genesis_{false};
  schemata::schema::validator_opcodes_t opcodes_;
  schemata::schema::build_error_code error_{
      schemata::schema::build_error_code::ok};
  std::string error_info_;
};

}  // namespace schemata::builder
