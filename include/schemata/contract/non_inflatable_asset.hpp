#pragma once
#include <schemata/interface/fungible_asset.hpp>
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/instruction.hpp>
#include <schemata/isa/offset_table.hpp>
#include <schemata/isa/opcode.hpp>
#include <schemata/schema/build_result.hpp>
#include <schemata/schema/iface_impl.hpp>
#include <schemata/schema/library.hpp>
#include <schemata/schema/package.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/schema.hpp>
#include <schemata/schema/type_system.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Non-inflatable asset (NIA): a fungible asset whose whole supply is issued
// at genesis and afterwards only moves between owners.
namespace schemata::contract {

inline constexpr schemata::schema::global_state_type_t kGsNominal = 2000;
inline constexpr schemata::schema::global_state_type_t kGsTerms = 2001;
inline constexpr schemata::schema::global_state_type_t kGsIssuedSupply = 2002;
inline constexpr schemata::schema::assignment_type_t kOsAsset = 4000;
inline constexpr schemata::schema::transition_type_t kTsTransfer = 10000;

inline constexpr auto kNiaSchemaName = std::string_view{"NonInflatableAsset"};

inline constexpr auto kFnGenesis = std::string_view{"genesis"};
inline constexpr auto kFnTransfer = std::string_view{"transfer"};

// Entry points of the validation library. The genesis check is a single
// `pccs` followed by `ret`, the transfer check starts right after it.
inline constexpr uint16_t kFnGenesisOffset = 0;
inline constexpr uint16_t kFnTransferOffset =
    kFnGenesisOffset +
    schemata::isa::instruction_size(schemata::isa::opcode_t::pccs) +
    schemata::isa::instruction_size(schemata::isa::opcode_t::ret);
static_assert(kFnTransferOffset == 6);

/// Operands baked into the validation library.
///
/// The genesis check (`pccs`) takes two bounds fixing the amount range the
/// range proofs may cover; the transfer check (`pcvs`) takes the commitment
/// family it verifies against. The defaults are the protocol values; a
/// schema author who needs another range must change them here, which
/// changes the library id and hence the schema id.
struct nia_config_t final {
  uint16_t genesis_upper_bound{4000};
  uint16_t genesis_lower_bound{2000};
  uint16_t transfer_commitment_family{4000};
};

/// Validation program with `genesis` and `transfer` labels.
std::vector<schemata::isa::statement_t> nia_program(const nia_config_t& config);

/// Recorded entry points and the opcode each must start with.
schemata::isa::offset_table nia_offsets();

class non_inflatable_asset final {
 public:
  static constexpr auto kFeatures =
      schemata::interface::fungible_features::none;

  explicit non_inflatable_asset(nia_config_t config = {});

  const nia_config_t& config() const { return config_; }

  /// Assembles the program and proves the offsets against it.
  schemata::schema::build_result<schemata::schema::library_t> library() const;

  schemata::schema::build_result<schemata::schema::schema_t> schema() const;

  /// `pccs` at genesis, `pcvs` at transfer. Enforced when the schema is
  /// built and recorded in the package.
  schemata::schema::validator_opcodes_t validator_opcodes() const;

  /// Binding to the fungible asset interface. Without a timestamp the
  /// current time is used.
  schemata::schema::build_result<schemata::schema::iface_impl_t> issue_impl(
      std::optional<schemata::schema::timestamp_seconds_t> timestamp =
          std::nullopt) const;

  schemata::schema::type_system_t types() const;

  schemata::schema::build_result<std::vector<schemata::schema::library_t>>
  scripts() const;

  schemata::schema::build_result<schemata::schema::package_t> package(
      std::optional<schemata::schema::timestamp_seconds_t> timestamp =
          std::nullopt) const;

 private:
  nia_config_t config_;
};

}  // namespace schemata::contract
