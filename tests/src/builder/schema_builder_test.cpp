#include <gtest/gtest.h>
#include <schemata/builder/schema_builder.hpp>
#include <schemata/schema/identity.hpp>
#include <schemata/testing/common.hpp>

using namespace schemata::schema;
using schemata::builder::schema_builder;
using schemata::testing::kAsset;
using schemata::testing::kIssuedSupply;
using schemata::testing::kTransfer;

TEST(schema_builder, builds_issued_supply_example) {
  auto library = schemata::testing::make_library();
  auto built = schemata::testing::make_example_builder(library_id(library))
                   .build({library});
  ASSERT_TRUE(built.ok()) << built.info;

  const auto& schema = *built.value;
  EXPECT_EQ(schema.name, "Example");
  ASSERT_NE(find_global_type(schema, kIssuedSupply), nullptr);
  EXPECT_FALSE(is_multiple(*find_global_type(schema, kIssuedSupply)));
  ASSERT_NE(find_owned_type(schema, kAsset), nullptr);
  EXPECT_EQ(find_owned_type(schema, kAsset)->kind, owned_state_kind::fungible);
  ASSERT_NE(find_transition(schema, kTransfer), nullptr);

  auto sites = validator_sites(schema);
  ASSERT_EQ(sites.size(), 2u);
  EXPECT_EQ(sites[0].offset, 0);
  EXPECT_EQ(sites[1].offset, 6);
}

TEST(schema_builder, same_inputs_give_same_schema_id) {
  auto library = schemata::testing::make_library();
  auto first = schemata::testing::make_example_builder(library_id(library))
                   .build({library});
  auto second = schemata::testing::make_example_builder(library_id(library))
                    .build({library});
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(schema_id(*first.value), schema_id(*second.value));
}

TEST(schema_builder, rejects_duplicate_global_state) {
  auto library = schemata::testing::make_library();
  auto builder = schemata::testing::make_example_builder(library_id(library));
  builder.add_global_state(kIssuedSupply,
                           global_state_once(sem_id("Other", "u8")));
  auto built = builder.build({library});
  EXPECT_EQ(built.code, build_error_code::duplicate_global_state);
}

TEST(schema_builder, first_error_wins) {
  auto library = schemata::testing::make_library();
  auto builder = schemata::testing::make_example_builder(library_id(library));
  builder.add_owned_state(kAsset, owned_declarative())
      .add_transition(kTransfer, transition_schema_t{});
  auto built = builder.build({library});
  EXPECT_EQ(built.code, build_error_code::duplicate_owned_state);
}

TEST(schema_builder, rejects_duplicate_transition) {
  auto library = schemata::testing::make_library();
  auto builder = schemata::testing::make_example_builder(library_id(library));
  builder.add_transition(kTransfer, transition_schema_t{});
  EXPECT_EQ(builder.build({library}).code,
            build_error_code::duplicate_transition);
}

TEST(schema_builder, rejects_second_genesis) {
  auto library = schemata::testing::make_library();
  auto builder = schemata::testing::make_example_builder(library_id(library));
  builder.set_genesis(genesis_schema_t{});
  EXPECT_EQ(builder.build({library}).code, build_error_code::duplicate_genesis);
}

TEST(schema_builder, rejects_missing_genesis) {
  auto builder = schema_builder{"Empty", "ssi:test"};
  builder.add_owned_state(kAsset, owned_fungible());
  EXPECT_EQ(builder.build({}).code, build_error_code::missing_genesis);
}

TEST(schema_builder, rejects_dangling_global_reference) {
  auto library = schemata::testing::make_library();
  auto builder = schema_builder{"Dangling", "ssi:test"};
  builder.add_owned_state(kAsset, owned_fungible())
      .set_genesis(genesis_schema_t{
          .globals = {{kIssuedSupply, occurs_once()}},
          .assignments = {{kAsset, occurs_once()}},
          .validator = make_lib_site(library_id(library), 0)});
  auto built = builder.build({library});
  EXPECT_FALSE(built.ok());
  EXPECT_EQ(built.code, build_error_code::unknown_global_state);
}

TEST(schema_builder, rejects_dangling_owned_reference_in_transition) {
  auto library = schemata::testing::make_library();
  auto builder = schemata::testing::make_example_builder(library_id(library));
  builder.add_transition(
      kTransfer + 1,
      transition_schema_t{.globals = {},
                          .inputs = {{kAsset + 1, occurs_once()}},
                          .assignments = {},
                          .validator = std::nullopt});
  EXPECT_EQ(builder.build({library}).code,
            build_error_code::unknown_owned_state);
}

TEST(schema_builder, rejects_duplicate_slot_in_rule) {
  auto library = schemata::testing::make_library();
  auto builder = schema_builder{"Repeat", "ssi:test"};
  builder.add_owned_state(kAsset, owned_fungible())
      .set_genesis(genesis_schema_t{
          .globals = {},
          .assignments = {{kAsset, occurs_once()}, {kAsset, occurs_once()}},
          .validator = std::nullopt});
  EXPECT_EQ(builder.build({library}).code,
            build_error_code::duplicate_owned_state);
}

TEST(schema_builder, rejects_validator_outside_the_script_set) {
  auto library = schemata::testing::make_library();
  auto built = schemata::testing::make_example_builder(library_id(library))
                   .build({});
  EXPECT_EQ(built.code, build_error_code::missing_library);
}

TEST(schema_builder, rejects_validator_inside_an_instruction) {
  auto library = schemata::testing::make_library();
  auto builder = schema_builder{"Misaligned", "ssi:test"};
  builder.add_owned_state(kAsset, owned_fungible())
      .set_genesis(genesis_schema_t{
          .globals = {},
          .assignments = {{kAsset, occurs_once()}},
          .validator = make_lib_site(library_id(library), 3)});
  EXPECT_EQ(builder.build({library}).code,
            build_error_code::validator_offset_out_of_range);
}

TEST(schema_builder, rejects_validator_with_wrong_opcode) {
  auto library = schemata::testing::make_library();
  auto builder = schemata::testing::make_example_builder(library_id(library));
  builder.require_genesis_opcode(schemata::isa::opcode_t::pccs)
      .require_transition_opcode(kTransfer, schemata::isa::opcode_t::pccs);
  EXPECT_EQ(builder.build({library}).code,
            build_error_code::validator_opcode_mismatch);
}

TEST(schema_builder, rejects_opcode_requirement_for_unknown_transition) {
  auto library = schemata::testing::make_library();
  auto builder = schemata::testing::make_example_builder(library_id(library));
  builder.require_transition_opcode(kTransfer + 1,
                                    schemata::isa::opcode_t::pcvs);
  EXPECT_EQ(builder.build({library}).code,
            build_error_code::validator_opcode_mismatch);
}

TEST(schema_builder, resolves_global_types_by_name) {
  auto types = make_type_system({{"Test.Amount", "u64"}});
  auto library = schemata::testing::make_library();

  auto unknown = schema_builder{"Typed", "ssi:test"};
  unknown.add_global_state(kIssuedSupply, types, "Test.Missing");
  EXPECT_EQ(unknown.build({library}).code, build_error_code::unknown_type);

  auto known = schema_builder{"Typed", "ssi:test"};
  known.add_global_state(kIssuedSupply, types, "Test.Amount", 4)
      .set_genesis(genesis_schema_t{});
  auto built = known.build({library});
  ASSERT_TRUE(built.ok()) << built.info;
  const auto* global = find_global_type(*built.value, kIssuedSupply);
  ASSERT_NE(global, nullptr);
  EXPECT_EQ(global->sem_id, sem_id("Test.Amount", "u64"));
  EXPECT_EQ(global->max_items, 4);
}

TEST(schema_builder, rejects_rule_no_count_can_meet) {
  auto library = schemata::testing::make_library();
  auto genesis = schema_builder{"Impossible", "ssi:test"};
  genesis.add_owned_state(kAsset, owned_fungible())
      .set_genesis(genesis_schema_t{
          .globals = {},
          .assignments = {{kAsset, occurs_once_or_up_to(0)}},
          .validator = std::nullopt});
  EXPECT_EQ(genesis.build({library}).code,
            build_error_code::unsatisfiable_occurrences);

  auto transition =
      schemata::testing::make_example_builder(library_id(library));
  transition.add_transition(
      kTransfer + 1,
      transition_schema_t{.globals = {},
                          .inputs = {{kAsset, occurs_once_or_up_to(0)}},
                          .assignments = {},
                          .validator = std::nullopt});
  EXPECT_EQ(transition.build({library}).code,
            build_error_code::unsatisfiable_occurrences);
}

TEST(schema_builder, unused_bound_does_not_change_schema_id) {
  auto library = schemata::testing::make_library();
  auto build = [&](const occurrences_t& issued) {
    auto builder = schema_builder{"Bounds", "ssi:test"};
    builder
        .add_global_state(kIssuedSupply,
                          global_state_once(sem_id("Test.Amount", "u64")))
        .set_genesis(genesis_schema_t{.globals = {{kIssuedSupply, issued}},
                                      .assignments = {},
                                      .validator = std::nullopt});
    return builder.build({library});
  };
  auto plain = build(occurs_once());
  auto padded = build(occurrences_t{.kind = occurrences_kind::once, .up_to = 7});
  ASSERT_TRUE(plain.ok()) << plain.info;
  ASSERT_TRUE(padded.ok()) << padded.info;
  EXPECT_EQ(padded.value->genesis.globals[0].second, occurs_once());
  EXPECT_EQ(schema_id(*plain.value), schema_id(*padded.value));
}
