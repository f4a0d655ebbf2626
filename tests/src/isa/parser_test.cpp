#include <gtest/gtest.h>
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/parser.hpp>

using namespace schemata::isa;
using namespace schemata::schema;

namespace {

constexpr auto kNiaSource = std::string_view{R"(
// SUBROUTINE 1: genesis validation
genesis:
    pccs    0x0FA0,0x07D0   ;
    ret                     ;
// SUBROUTINE 2: transfer validation
transfer:
    pcvs    0x0FA0          ;
)"};

}  // namespace

TEST(parser, parses_labels_and_instructions) {
  auto parsed = parse_assembly(kNiaSource);
  ASSERT_TRUE(parsed.ok()) << parsed.info;
  ASSERT_EQ(parsed.value->size(), 5u);

  const auto& statements = *parsed.value;
  EXPECT_EQ(std::get<label_t>(statements[0]).name, "genesis");
  const auto& pccs =
      std::get<pccs_t>(std::get<instruction_t>(statements[1]));
  EXPECT_EQ(pccs.upper_bound, 4000);
  EXPECT_EQ(pccs.lower_bound, 2000);
  EXPECT_EQ(std::get<label_t>(statements[3]).name, "transfer");
}

TEST(parser, parsed_program_assembles_with_expected_labels) {
  auto parsed = parse_assembly(kNiaSource);
  ASSERT_TRUE(parsed.ok());
  auto assembly = assemble(*parsed.value);
  ASSERT_TRUE(assembly.ok()) << assembly.info;
  EXPECT_EQ(find_label(*assembly.value, "transfer"), uint16_t{6});
  EXPECT_EQ(assembly.value->library.code.size(), 9u);
}

TEST(parser, accepts_several_statements_on_one_line) {
  auto parsed = parse_assembly("start: jif end; fail; end: succ");
  ASSERT_TRUE(parsed.ok()) << parsed.info;
  ASSERT_EQ(parsed.value->size(), 5u);
  const auto& jif = std::get<jif_t>(std::get<instruction_t>((*parsed.value)[1]));
  EXPECT_EQ(std::get<std::string>(jif.target), "end");
}

TEST(parser, accepts_decimal_operands) {
  auto parsed = parse_assembly("pcvs 4000");
  ASSERT_TRUE(parsed.ok());
  const auto& pcvs = std::get<pcvs_t>(std::get<instruction_t>((*parsed.value)[0]));
  EXPECT_EQ(pcvs.family, 4000);
}

TEST(parser, rejects_unknown_mnemonic_with_line_number) {
  auto parsed = parse_assembly("succ\nbogus 1\n");
  EXPECT_EQ(parsed.code, build_error_code::malformed_instruction);
  EXPECT_NE(parsed.info.find("line 2"), std::string::npos);
}

TEST(parser, rejects_wrong_operand_count) {
  EXPECT_EQ(parse_assembly("pccs 0x0FA0").code,
            build_error_code::malformed_instruction);
  EXPECT_EQ(parse_assembly("ret 1").code,
            build_error_code::malformed_instruction);
}

TEST(parser, rejects_operands_wider_than_16_bits) {
  auto parsed = parse_assembly("pcvs 0x10000");
  EXPECT_EQ(parsed.code, build_error_code::operand_out_of_range);
}

TEST(parser, rejects_invalid_label) {
  auto parsed = parse_assembly("1abc: succ");
  EXPECT_EQ(parsed.code, build_error_code::malformed_instruction);
}

TEST(parser, empty_source_yields_no_statements) {
  auto parsed = parse_assembly("  // nothing here\n");
  ASSERT_TRUE(parsed.ok());
  EXPECT_TRUE(parsed.value->empty());
}

TEST(parser, rejects_trailing_comma) {
  auto single = parse_assembly("pcvs 5,\n");
  EXPECT_EQ(single.code, build_error_code::malformed_instruction);

  auto pair = parse_assembly("succ\npccs 0x0FA0,0x07D0, ;\n");
  EXPECT_EQ(pair.code, build_error_code::malformed_instruction);
  EXPECT_NE(pair.info.find("line 2"), std::string::npos);
}

TEST(parser, rejects_empty_leading_operand) {
  EXPECT_EQ(parse_assembly("pccs ,0x07D0").code,
            build_error_code::malformed_instruction);
}

TEST(parse_operand, accepts_decimal_and_hex) {
  EXPECT_EQ(parse_operand("4000").value, uint16_t{4000});
  EXPECT_EQ(parse_operand("0x07D2").value, uint16_t{2002});
  EXPECT_EQ(parse_operand("65535").value, uint16_t{65535});
}

TEST(parse_operand, rejects_signs_and_overflow) {
  EXPECT_EQ(parse_operand("-1").code, build_error_code::malformed_instruction);
  EXPECT_EQ(parse_operand("+1").code, build_error_code::malformed_instruction);
  EXPECT_EQ(parse_operand("65536").code,
            build_error_code::operand_out_of_range);
  EXPECT_EQ(parse_operand("").code, build_error_code::malformed_instruction);
}
