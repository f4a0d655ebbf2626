#pragma once
#include <schemata/isa/opcode.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// Symbolic instructions, the assembler's input and the disassembler's
// output.
namespace schemata::isa {

// Absolute byte offset or the name of a label declared in the same program.
using jump_target_t = std::variant<uint16_t, std::string>;

struct fail_t final {};
struct succ_t final {};
struct ret_t final {};

struct jmp_t final {
  jump_target_t target;
};

struct jif_t final {
  jump_target_t target;
};

struct routine_t final {
  jump_target_t target;
};

struct pcvs_t final {
  uint16_t family{};
};

struct pcas_t final {
  uint16_t family{};
};

struct pcps_t final {
  uint16_t family{};
};

struct pccs_t final {
  uint16_t upper_bound{};
  uint16_t lower_bound{};
};

using instruction_t = std::variant<fail_t,
                                   succ_t,
                                   ret_t,
                                   jmp_t,
                                   jif_t,
                                   routine_t,
                                   pcvs_t,
                                   pcas_t,
                                   pcps_t,
                                   pccs_t>;

// Marks a subroutine boundary: the label takes the offset of the next
// instruction.
struct label_t final {
  std::string name;
};

using statement_t = std::variant<label_t, instruction_t>;

struct located_instruction_t final {
  uint16_t offset{};
  instruction_t instruction;
};

opcode_t opcode_of(const instruction_t& instruction);

// Assembly listing form, e.g. "pccs 0x0FA0,0x07D0".
std::string to_string(const instruction_t& instruction);

}  // namespace schemata::isa

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
