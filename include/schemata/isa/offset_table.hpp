#pragma once
#include <schemata/isa/assembler.hpp>
#include <schemata/isa/opcode.hpp>
#include <schemata/schema/build_result.hpp>
#include <schemata/schema/library.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemata::isa {

struct offset_entry_t final {
  std::string name;
  uint16_t offset{};
  // Opcode the subroutine's contract requires as its first instruction.
  opcode_t opcode{opcode_t::fail};
};

/// Subroutine name -> entry offset, checked against an assembled stream.
///
/// The offsets are authored as constants next to the program; `verify`
/// proves that each one still addresses the opcode the schema relies on, so
/// an edit that shifts code without updating the constants fails the build
/// instead of wiring a validator to the wrong check.
class offset_table final {
 public:
  offset_table() = default;
  explicit offset_table(std::vector<offset_entry_t> entries);

  offset_table& add(std::string name, uint16_t offset, opcode_t opcode);

  std::optional<uint16_t> offset_of(std::string_view name) const;
  const std::vector<offset_entry_t>& entries() const { return entries_; }

  /// Checks every entry and, where the assembly carries a label of the same
  /// name, that the label agrees with the recorded offset. Returns the
  /// verified library.
  schemata::schema::build_result<schemata::schema::library_t> verify(
      const assembly_t& assembly) const;

 private:
  std::vector<offset_entry_t> entries_;
};

/// Checks that `offset` is the first byte of an instruction inside `library`
/// and, when `required` is set, that the instruction is that opcode.
schemata::schema::build_result<opcode_t> verify_site(
    const schemata::schema::library_t& library,
    uint16_t offset,
    std::optional<opcode_t> required = std::nullopt);

}  // namespace schemata::isa
