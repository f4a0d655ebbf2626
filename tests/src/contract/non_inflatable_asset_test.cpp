#include <gtest/gtest.h>
#include <schemata/builder/iface_impl_builder.hpp>
#include <schemata/builder/package_builder.hpp>
#include <schemata/contract/non_inflatable_asset.hpp>
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/parser.hpp>
#include <schemata/schema/identity.hpp>

using namespace schemata::contract;
using namespace schemata::schema;

TEST(non_inflatable_asset, entry_points_match_the_assembled_library) {
  auto assembly = schemata::isa::assemble(nia_program(nia_config_t{}));
  ASSERT_TRUE(assembly.ok()) << assembly.info;
  EXPECT_EQ(schemata::isa::find_label(*assembly.value, kFnGenesis),
            kFnGenesisOffset);
  EXPECT_EQ(schemata::isa::find_label(*assembly.value, kFnTransfer),
            kFnTransferOffset);
  EXPECT_EQ(kFnGenesisOffset, 0);
  EXPECT_EQ(kFnTransferOffset, 6);
  EXPECT_TRUE(nia_offsets().verify(*assembly.value).ok());
}

TEST(non_inflatable_asset, library_carries_configured_operands) {
  auto nia = non_inflatable_asset{nia_config_t{.genesis_upper_bound = 0x0FA0,
                                               .genesis_lower_bound = 0x07D0,
                                               .transfer_commitment_family =
                                                   0x0FA0}};
  auto library = nia.library();
  ASSERT_TRUE(library.ok()) << library.info;
  auto expected = bytes_t{0xD3, 0xA0, 0x0F, 0xD0, 0x07, 0x06, 0xD0, 0xA0, 0x0F};
  EXPECT_EQ(library.value->code, expected);
  EXPECT_EQ(library.value->isa, "COMMIT+CTRL");
}

TEST(non_inflatable_asset, library_matches_hand_written_source) {
  auto parsed = schemata::isa::parse_assembly(
      "genesis:\n"
      "    pccs 0x0FA0,0x07D0 ;\n"
      "    ret ;\n"
      "transfer:\n"
      "    pcvs 0x0FA0 ;\n");
  ASSERT_TRUE(parsed.ok()) << parsed.info;
  auto assembly = schemata::isa::assemble(*parsed.value);
  ASSERT_TRUE(assembly.ok());

  auto library = non_inflatable_asset{}.library();
  ASSERT_TRUE(library.ok());
  EXPECT_EQ(assembly.value->id, library_id(*library.value));
}

TEST(non_inflatable_asset, schema_declares_slots_and_validators) {
  auto nia = non_inflatable_asset{};
  auto schema = nia.schema();
  ASSERT_TRUE(schema.ok()) << schema.info;

  EXPECT_EQ(schema.value->name, kNiaSchemaName);
  EXPECT_EQ(schema.value->global_types.size(), 3u);
  ASSERT_NE(find_owned_type(*schema.value, kOsAsset), nullptr);
  EXPECT_EQ(find_owned_type(*schema.value, kOsAsset)->fungible,
            fungible_type::unsigned_64bit);

  auto lib_id = library_id(*nia.library().value);
  ASSERT_TRUE(schema.value->genesis.validator.has_value());
  EXPECT_EQ(*schema.value->genesis.validator,
            make_lib_site(lib_id, kFnGenesisOffset));
  const auto* transfer = find_transition(*schema.value, kTsTransfer);
  ASSERT_NE(transfer, nullptr);
  EXPECT_EQ(*transfer->validator, make_lib_site(lib_id, kFnTransferOffset));
  ASSERT_EQ(transfer->inputs.size(), 1u);
  EXPECT_EQ(transfer->inputs[0].second, occurs_once_or_more());
}

TEST(non_inflatable_asset, schema_id_is_stable_across_builds) {
  auto first = non_inflatable_asset{}.schema();
  auto second = non_inflatable_asset{}.schema();
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(schema_id(*first.value), schema_id(*second.value));
}

TEST(non_inflatable_asset, operands_change_the_schema_id) {
  auto defaults = non_inflatable_asset{}.schema();
  auto widened =
      non_inflatable_asset{nia_config_t{.genesis_upper_bound = 8000}}.schema();
  ASSERT_TRUE(defaults.ok());
  ASSERT_TRUE(widened.ok());
  EXPECT_NE(schema_id(*defaults.value), schema_id(*widened.value));
}

TEST(non_inflatable_asset, binds_to_the_base_fungible_interface) {
  auto impl = non_inflatable_asset{}.issue_impl(1700000000);
  ASSERT_TRUE(impl.ok()) << impl.info;
  EXPECT_EQ(impl.value->timestamp, 1700000000);
  EXPECT_EQ(impl.value->iface_id,
            iface_id(schemata::interface::fungible_asset_iface(
                schemata::interface::fungible_features::none)));
  ASSERT_EQ(impl.value->transitions.size(), 1u);
  EXPECT_EQ(impl.value->transitions[0].name, "transfer");
}

TEST(non_inflatable_asset, cannot_bind_to_the_inflatable_interface) {
  auto schema = non_inflatable_asset{}.schema();
  ASSERT_TRUE(schema.ok());
  auto builder = schemata::builder::iface_impl_builder{
      *schema.value, schemata::interface::fungible_asset_iface(
                         schemata::interface::fungible_features::inflatable)};
  builder.timestamp(1700000000)
      .map_global_state(kGsNominal, "spec")
      .map_global_state(kGsTerms, "terms")
      .map_assignment(kOsAsset, "assetOwner")
      .map_transition(kTsTransfer, "transfer");
  EXPECT_EQ(builder.build().code, build_error_code::interface_category_missing);
}

TEST(non_inflatable_asset, package_validates) {
  auto package = non_inflatable_asset{}.package(1700000000);
  ASSERT_TRUE(package.ok()) << package.info;
  EXPECT_EQ(package.value->scripts.size(), 1u);
  EXPECT_TRUE(schemata::builder::validate_package(*package.value).ok());
}

TEST(non_inflatable_asset, package_records_validator_opcodes) {
  auto asset = non_inflatable_asset{};
  auto package = asset.package(1700000000);
  ASSERT_TRUE(package.ok()) << package.info;
  const auto& opcodes = package.value->validator_opcodes;
  EXPECT_EQ(opcodes.genesis, schemata::isa::opcode_t::pccs);
  ASSERT_EQ(opcodes.transitions.size(), 1u);
  EXPECT_EQ(opcodes.transitions[0].first, kTsTransfer);
  EXPECT_EQ(opcodes.transitions[0].second, schemata::isa::opcode_t::pcvs);
}

TEST(non_inflatable_asset, package_with_swapped_offsets_fails_validation) {
  auto package = non_inflatable_asset{}.package(1700000000);
  ASSERT_TRUE(package.ok()) << package.info;

  auto tampered = *package.value;
  tampered.schema.genesis.validator->offset = kFnTransferOffset;
  tampered.schema.transitions.front().second.validator->offset =
      kFnGenesisOffset;
  tampered.iface_impl.schema_id = schema_id(tampered.schema);
  EXPECT_EQ(schemata::builder::validate_package(tampered).code,
            build_error_code::validator_opcode_mismatch);
}
