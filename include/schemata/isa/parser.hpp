#pragma once
#include <schemata/isa/instruction.hpp>
#include <schemata/schema/build_result.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace schemata::isa {

// Parses assembly text into statements.
//
//   // SUBROUTINE 1: genesis validation
//   genesis:
//       pccs    0x0FA0,0x07D0   ;
//       ret                     ;
//   transfer:
//       pcvs    0x0FA0          ;
//
// Statements end at ';' or a newline, `//` starts a comment, `name:`
// declares a label. Numbers are decimal or 0x-prefixed hex; jump family
// instructions also accept a label name.
schemata::schema::build_result<std::vector<statement_t>> parse_assembly(
    std::string_view source);

// One 16-bit operand, decimal or 0x-prefixed hex. A sign is malformed.
schemata::schema::build_result<uint16_t> parse_operand(std::string_view text);

}  // namespace schemata::isa
