#include <fmt/format.h>
#include <schemata/isa/instruction.hpp>

namespace schemata::isa {

namespace {

std::string format_target(const jump_target_t& target) {
  return std::visit(
      overloaded{
          [](const uint16_t offset) { return fmt::format("0x{:04X}", offset); },
          [](const std::string& label) { return label; }},
      target);
}

}  // namespace

opcode_t opcode_of(const instruction_t& instruction) {
  return std::visit(overloaded{[](const fail_t&) { return opcode_t::fail; },
                               [](const succ_t&) { return opcode_t::succ; },
                               [](const ret_t&) { return opcode_t::ret; },
                               [](const jmp_t&) { return opcode_t::jmp; },
                               [](const jif_t&) { return opcode_t::jif; },
                               [](const routine_t&) {
                                 return opcode_t::routine;
                               },
                               [](const pcvs_t&) { return opcode_t::pcvs; },
                               [](const pcas_t&) { return opcode_t::pcas; },
                               [](const pcps_t&) { return opcode_t::pcps; },
                               [](const pccs_t&) { return opcode_t::pccs; }},
                    instruction);
}

std::string to_string(const instruction_t& instruction) {
  auto mnemonic = std::string{to_string(opcode_of(instruction))};
  return std::visit(
      overloaded{
          [&](const jmp_t& i) {
            return fmt::format("{} {}", mnemonic, format_target(i.target));
          },
          [&](const jif_t& i) {
            return fmt::format("{} {}", mnemonic, format_target(i.target));
          },
          [&](const routine_t& i) {
            return fmt::format("{} {}", mnemonic, format_target(i.target));
          },
          [&](const pcvs_t& i) {
            return fmt::format("{} 0x{:04X}", mnemonic, i.family);
          },
          [&](const pcas_t& i) {
            return fmt::format("{} 0x{:04X}", mnemonic, i.family);
          },
          [&](const pcps_t& i) {
            return fmt::format("{} 0x{:04X}", mnemonic, i.family);
          },
          [&](const pccs_t& i) {
            return fmt::format("{} 0x{:04X},0x{:04X}", mnemonic, i.upper_bound,
                               i.lower_bound);
          },
          [&](const auto&) { return mnemonic; }},
      instruction);
}

}  // namespace schemata::isa
