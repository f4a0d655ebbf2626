#include <gtest/gtest.h>
#include <schemata/blake3/hash.hpp>
#include <schemata/schema/identity.hpp>
#include <schemata/schema/type_system.hpp>
#include <schemata/testing/common.hpp>

using namespace schemata::schema;

TEST(identity, library_id_depends_only_on_content) {
  auto first = schemata::testing::make_library();
  auto second = schemata::testing::make_library();
  EXPECT_EQ(library_id(first), library_id(second));

  second.data.push_back(0x01);
  EXPECT_NE(library_id(first), library_id(second));
}

TEST(identity, ids_are_domain_separated) {
  auto empty = bytes_t{};
  auto library_tagged =
      schemata::blake3::tagged_hash(kLibraryIdTag, bytes_view_t{empty});
  auto schema_tagged =
      schemata::blake3::tagged_hash(kSchemaIdTag, bytes_view_t{empty});
  EXPECT_NE(library_tagged, schema_tagged);
  EXPECT_NE(sem_id("A", "u8"), sem_id("A", "u16"));
  EXPECT_NE(sem_id("Au", "8"), sem_id("A", "u8"));
}

TEST(identity, schema_id_ignores_builder_insertion_order) {
  auto library = schemata::testing::make_library();
  auto lib_id = library_id(library);
  auto amount = sem_id("Test.Amount", "u64");
  auto name = sem_id("Test.Name", "str");

  auto forward = schemata::builder::schema_builder{"Example", "ssi:test"};
  forward.add_global_state(1, global_state_once(name))
      .add_global_state(2, global_state_once(amount))
      .add_owned_state(10, owned_fungible())
      .set_genesis(genesis_schema_t{
          .globals = {{1, occurs_once()}, {2, occurs_once()}},
          .assignments = {{10, occurs_once_or_more()}},
          .validator = make_lib_site(lib_id, 0)});

  auto backward = schemata::builder::schema_builder{"Example", "ssi:test"};
  backward.add_owned_state(10, owned_fungible())
      .add_global_state(2, global_state_once(amount))
      .add_global_state(1, global_state_once(name))
      .set_genesis(genesis_schema_t{
          .globals = {{2, occurs_once()}, {1, occurs_once()}},
          .assignments = {{10, occurs_once_or_more()}},
          .validator = make_lib_site(lib_id, 0)});

  auto lhs = forward.build({library});
  auto rhs = backward.build({library});
  ASSERT_TRUE(lhs.ok()) << lhs.info;
  ASSERT_TRUE(rhs.ok()) << rhs.info;
  EXPECT_EQ(*lhs.value, *rhs.value);
  EXPECT_EQ(schema_id(*lhs.value), schema_id(*rhs.value));
}

TEST(identity, schema_id_follows_validator_library) {
  auto library = schemata::testing::make_library();
  auto other = schemata::testing::make_library(4000, 2000, 4001);

  auto first =
      schemata::testing::make_example_builder(library_id(library)).build(
          {library});
  auto second =
      schemata::testing::make_example_builder(library_id(other)).build(
          {other});
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_NE(schema_id(*first.value), schema_id(*second.value));
}

TEST(type_system, sorts_and_resolves_names) {
  auto types = make_type_system({{"B.Second", "u16"}, {"A.First", "u8"}});
  ASSERT_EQ(types.types.size(), 2u);
  EXPECT_EQ(types.types[0].name, "A.First");
  EXPECT_EQ(find_type(types, "B.Second"), sem_id("B.Second", "u16"));
  EXPECT_FALSE(find_type(types, "C.Third").has_value());
}

TEST(type_system, merge_keeps_the_base_definition) {
  auto base = make_type_system({{"A.First", "u8"}});
  auto extra = make_type_system({{"A.First", "u64"}, {"B.Second", "u16"}});
  auto merged = merge_type_systems(base, extra);
  ASSERT_EQ(merged.types.size(), 2u);
  EXPECT_EQ(find_type(merged, "A.First"), sem_id("A.First", "u8"));
}
