#include <spdlog/spdlog.h>
#include <schemata/builder/iface_impl_builder.hpp>
#include <schemata/builder/package_builder.hpp>
#include <schemata/builder/schema_builder.hpp>
#include <schemata/contract/non_inflatable_asset.hpp>
#include <schemata/schema/identity.hpp>

#include <string>
#include <utility>

using namespace schemata::schema;

namespace schemata::contract {

std::vector<schemata::isa::statement_t> nia_program(
    const nia_config_t& config) {
  using namespace schemata::isa;
  return {
      // Genesis: the pedersen commitments of all issued assignments must sum
      // to the issued supply reported in global state.
      label_t{std::string{kFnGenesis}},
      instruction_t{pccs_t{.upper_bound = config.genesis_upper_bound,
                           .lower_bound = config.genesis_lower_bound}},
      // Terminate on success.
      instruction_t{ret_t{}},
      // Transfer: inputs and outputs must commit to the same sum.
      label_t{std::string{kFnTransfer}},
      instruction_t{pcvs_t{.family = config.transfer_commitment_family}},
  };
}

schemata::isa::offset_table nia_offsets() {
  auto table = schemata::isa::offset_table{};
  table.add(std::string{kFnGenesis}, kFnGenesisOffset,
            schemata::isa::opcode_t::pccs);
  table.add(std::string{kFnTransfer}, kFnTransferOffset,
            schemata::isa::opcode_t::pcvs);
  return table;
}

non_inflatable_asset::non_inflatable_asset(nia_config_t config)
    : config_(config) {}

build_result<library_t> non_inflatable_asset::library() const {
  auto assembly = schemata::isa::assemble(nia_program(config_));
  if (!assembly) {
    return forward_failure<library_t>(assembly);
  }
  return nia_offsets().verify(*assembly.value);
}

type_system_t non_inflatable_asset::types() const {
  return schemata::interface::fungible_asset_types();
}

build_result<schema_t> non_inflatable_asset::schema() const {
  auto library = this->library();
  if (!library) {
    return forward_failure<schema_t>(library);
  }
  auto lib_id = library_id(*library.value);
  auto types = this->types();

  auto builder = schemata::builder::schema_builder{
      std::string{kNiaSchemaName},
      identity_t{schemata::interface::kStandardsIdentity}};
  builder
      .add_global_state(kGsNominal, types, schemata::interface::kTypeAssetSpec)
      .add_global_state(kGsTerms, types,
                        schemata::interface::kTypeContractTerms)
      .add_global_state(kGsIssuedSupply, types,
                        schemata::interface::kTypeAmount)
      .add_owned_state(kOsAsset, owned_fungible(fungible_type::unsigned_64bit))
      .set_genesis(genesis_schema_t{
          .globals = {{kGsNominal, occurs_once()},
                      {kGsTerms, occurs_once()},
                      {kGsIssuedSupply, occurs_once()}},
          .assignments = {{kOsAsset, occurs_once_or_more()}},
          .validator = make_lib_site(lib_id, kFnGenesisOffset)})
      .add_transition(kTsTransfer,
                      transition_schema_t{
                          .globals = {},
                          .inputs = {{kOsAsset, occurs_once_or_more()}},
                          .assignments = {{kOsAsset, occurs_once_or_more()}},
                          .validator = make_lib_site(lib_id, kFnTransferOffset)});
  auto opcodes = validator_opcodes();
  if (opcodes.genesis) {
    builder.require_genesis_opcode(*opcodes.genesis);
  }
  for (const auto& [id, opcode] : opcodes.transitions) {
    builder.require_transition_opcode(id, opcode);
  }
  return builder.build({*library.value});
}

validator_opcodes_t non_inflatable_asset::validator_opcodes() const {
  return validator_opcodes_t{
      .genesis = schemata::isa::opcode_t::pccs,
      .transitions = {{kTsTransfer, schemata::isa::opcode_t::pcvs}}};
}

build_result<iface_impl_t> non_inflatable_asset::issue_impl(
    const std::optional<timestamp_seconds_t> timestamp) const {
  auto schema = this->schema();
  if (!schema) {
    return forward_failure<iface_impl_t>(schema);
  }
  auto builder = schemata::builder::iface_impl_builder{
      std::move(*schema.value),
      schemata::interface::fungible_asset_iface(kFeatures)};
  builder.developer(identity_t{schemata::interface::kStandardsIdentity})
      .version(ver_no_t::v1)
      .map_global_state(kGsNominal, "spec")
      .map_global_state(kGsTerms, "terms")
      .map_global_state(kGsIssuedSupply, "issuedSupply")
      .map_assignment(kOsAsset, "assetOwner")
      .map_transition(kTsTransfer, "transfer");
  if (timestamp) {
    builder.timestamp(*timestamp);
  }
  return builder.build();
}

build_result<std::vector<library_t>> non_inflatable_asset::scripts() const {
  auto library = this->library();
  if (!library) {
    return forward_failure<std::vector<library_t>>(library);
  }
  return make_build_success(
      schemata::builder::make_script_set({std::move(*library.value)}));
}

build_result<package_t> non_inflatable_asset::package(
    const std::optional<timestamp_seconds_t> timestamp) const {
  auto schema = this->schema();
  if (!schema) {
    return forward_failure<package_t>(schema);
  }
  auto impl = issue_impl(timestamp);
  if (!impl) {
    return forward_failure<package_t>(impl);
  }
  auto scripts = this->scripts();
  if (!scripts) {
    return forward_failure<package_t>(scripts);
  }
  auto package = schemata::builder::make_package(
      std::move(*schema.value), std::move(*impl.value), types(),
      std::move(*scripts.value), validator_opcodes());
  if (package) {
    spdlog::info("Built {} package, schema {}", kNiaSchemaName,
                 to_hex(schema_id(package.value->schema)));
  }
  return package;
}

}  // namespace schemata::contract
