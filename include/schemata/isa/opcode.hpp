#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Opcode table of the validation VM. The VM itself lives elsewhere; the
// compiler only needs mnemonics, byte values and operand layouts to lay out
// code and to prove which opcode sits at a given offset.
namespace schemata::isa {

enum class opcode_t : uint8_t {
  // Control flow
  fail = 0x00,
  succ = 0x01,
  jmp = 0x02,
  jif = 0x03,
  routine = 0x04,
  ret = 0x06,
  // Pedersen commitment checks
  pcvs = 0xD0,  // sum(inputs) == sum(outputs) for a commitment family
  pcas = 0xD1,  // sum(outputs) == declared total (inflation)
  pcps = 0xD2,  // sum(inputs) == declared total (burn)
  pccs = 0xD3,  // sum(commitments) == declared total within bounds
};

enum class operand_layout : uint8_t {
  none = 0,
  u16 = 1,
  u16_u16 = 2,
};

inline constexpr auto kCtrlExtension = std::string_view{"CTRL"};
inline constexpr auto kCommitExtension = std::string_view{"COMMIT"};

struct opcode_info_t final {
  opcode_t opcode;
  std::string_view mnemonic;
  operand_layout layout;
  std::string_view extension;
};

inline constexpr auto kOpcodeTable = std::array{
    opcode_info_t{opcode_t::fail, "fail", operand_layout::none, kCtrlExtension},
    opcode_info_t{opcode_t::succ, "succ", operand_layout::none, kCtrlExtension},
    opcode_info_t{opcode_t::jmp, "jmp", operand_layout::u16, kCtrlExtension},
    opcode_info_t{opcode_t::jif, "jif", operand_layout::u16, kCtrlExtension},
    opcode_info_t{opcode_t::routine, "routine", operand_layout::u16,
                  kCtrlExtension},
    opcode_info_t{opcode_t::ret, "ret", operand_layout::none, kCtrlExtension},
    opcode_info_t{opcode_t::pcvs, "pcvs", operand_layout::u16,
                  kCommitExtension},
    opcode_info_t{opcode_t::pcas, "pcas", operand_layout::u16,
                  kCommitExtension},
    opcode_info_t{opcode_t::pcps, "pcps", operand_layout::u16,
                  kCommitExtension},
    opcode_info_t{opcode_t::pccs, "pccs", operand_layout::u16_u16,
                  kCommitExtension},
};

// Largest stream a 16-bit offset can address.
inline constexpr std::size_t kMaxCodeSize = 0xFFFF;

constexpr std::optional<opcode_info_t> find_opcode(const uint8_t byte) {
  for (const auto& info : kOpcodeTable) {
    if (static_cast<uint8_t>(info.opcode) == byte) {
      return info;
    }
  }
  return std::nullopt;
}

constexpr std::optional<opcode_info_t> find_mnemonic(
    const std::string_view mnemonic) {
  for (const auto& info : kOpcodeTable) {
    if (info.mnemonic == mnemonic) {
      return info;
    }
  }
  return std::nullopt;
}

constexpr const opcode_info_t& opcode_info(const opcode_t opcode) {
  for (const auto& entry : kOpcodeTable) {
    if (entry.opcode == opcode) {
      return entry;
    }
  }
  // Every enumerator has a table row.
  return kOpcodeTable[0];
}

constexpr uint16_t operand_count(const operand_layout layout) {
  switch (layout) {
    case operand_layout::none:
      return 0;
    case operand_layout::u16:
      return 1;
    case operand_layout::u16_u16:
      return 2;
  }
  return 0;
}

constexpr uint16_t instruction_size(const opcode_t opcode) {
  return static_cast<uint16_t>(
      1 + 2 * operand_count(opcode_info(opcode).layout));
}

constexpr std::string_view to_string(const opcode_t opcode) {
  return opcode_info(opcode).mnemonic;
}

static_assert(instruction_size(opcode_t::ret) == 1);
static_assert(instruction_size(opcode_t::pcvs) == 3);
static_assert(instruction_size(opcode_t::pccs) == 5);

}  // namespace schemata::isa
