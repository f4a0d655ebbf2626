#pragma once
#include <schemata/isa/instruction.hpp>
#include <schemata/schema/build_result.hpp>
#include <schemata/schema/library.hpp>
#include <schemata/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace schemata::isa {

/// Result of assembling one program.
struct assembly_t final {
  schemata::schema::library_t library;
  schemata::schema::library_id_t id{};
  /// Subroutine boundaries in declaration order.
  std::vector<std::pair<std::string, uint16_t>> labels;
};

/// Lay out `statements` into a library.
///
/// Two passes: the first assigns offsets to labels and enforces the code
/// size limit, the second emits bytes and resolves jump targets. Fails with
/// `malformed_instruction` for an empty program or a duplicate/empty label,
/// `operand_out_of_range` for a jump that does not land on an instruction
/// inside the stream, and `code_too_large` past `kMaxCodeSize` bytes.
schemata::schema::build_result<assembly_t> assemble(
    const std::vector<statement_t>& statements);

/// Convenience overload for label-free programs.
schemata::schema::build_result<assembly_t> assemble(
    const std::vector<instruction_t>& instructions);

/// Decode a raw stream back into located instructions. Fails with
/// `malformed_instruction` on an unknown opcode or a truncated operand.
schemata::schema::build_result<std::vector<located_instruction_t>>
disassemble(const schemata::schema::bytes_view_t& code);

std::optional<uint16_t> find_label(const assembly_t& assembly,
                                   std::string_view name);

/// One listing line per instruction: "0006  pcvs 0x0FA0".
std::string listing(const std::vector<located_instruction_t>& instructions);

}  // namespace schemata::isa
