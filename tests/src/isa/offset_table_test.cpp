#include <gtest/gtest.h>
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/offset_table.hpp>
#include <schemata/testing/common.hpp>

using namespace schemata::isa;
using namespace schemata::schema;

namespace {

assembly_t make_labelled_assembly() {
  auto assembly = assemble(std::vector<statement_t>{
      label_t{"genesis"},
      instruction_t{pccs_t{.upper_bound = 4000, .lower_bound = 2000}},
      instruction_t{ret_t{}}, label_t{"transfer"},
      instruction_t{pcvs_t{.family = 4000}}});
  return *assembly.value;
}

}  // namespace

TEST(offset_table, verifies_recorded_entry_points) {
  auto table = offset_table{};
  table.add("genesis", 0, opcode_t::pccs).add("transfer", 6, opcode_t::pcvs);
  auto verified = table.verify(make_labelled_assembly());
  ASSERT_TRUE(verified.ok()) << verified.info;
  EXPECT_EQ(verified.value->code.size(), 9u);
  EXPECT_EQ(table.offset_of("transfer"), uint16_t{6});
  EXPECT_FALSE(table.offset_of("burn").has_value());
}

TEST(offset_table, detects_label_drift) {
  auto table = offset_table{std::vector<offset_entry_t>{offset_entry_t{
      .name = "transfer", .offset = 5, .opcode = opcode_t::pcvs}}};
  auto verified = table.verify(make_labelled_assembly());
  EXPECT_EQ(verified.code, build_error_code::label_offset_mismatch);
}

TEST(offset_table, detects_wrong_opcode_without_labels) {
  auto assembly = assemble(schemata::testing::make_program());
  ASSERT_TRUE(assembly.ok());
  auto table = offset_table{};
  table.add("transfer", 5, opcode_t::pcvs);
  auto verified = table.verify(*assembly.value);
  EXPECT_EQ(verified.code, build_error_code::validator_opcode_mismatch);
}

TEST(verify_site, reports_the_opcode_at_an_instruction_boundary) {
  auto library = schemata::testing::make_library();
  auto site = verify_site(library, 6);
  ASSERT_TRUE(site.ok());
  EXPECT_EQ(*site.value, opcode_t::pcvs);
}

TEST(verify_site, rejects_offset_inside_an_instruction) {
  auto library = schemata::testing::make_library();
  auto site = verify_site(library, 2);
  EXPECT_EQ(site.code, build_error_code::validator_offset_out_of_range);
}

TEST(verify_site, rejects_offset_past_the_end) {
  auto library = schemata::testing::make_library();
  auto site = verify_site(library, 9);
  EXPECT_EQ(site.code, build_error_code::validator_offset_out_of_range);
}

TEST(verify_site, rejects_opcode_mismatch) {
  auto library = schemata::testing::make_library();
  auto site = verify_site(library, 0, opcode_t::pcvs);
  EXPECT_EQ(site.code, build_error_code::validator_opcode_mismatch);
}
