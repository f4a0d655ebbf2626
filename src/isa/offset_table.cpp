#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <schemata/isa/offset_table.hpp>

#include <algorithm>
#include <utility>

using namespace schemata::schema;

namespace schemata::isa {

offset_table::offset_table(std::vector<offset_entry_t> entries)
    : entries_(std::move(entries)) {}

offset_table& offset_table::add(std::string name,
                                const uint16_t offset,
                                const opcode_t opcode) {
  entries_.push_back(offset_entry_t{
      .name = std::move(name), .offset = offset, .opcode = opcode});
  return *this;
}

std::optional<uint16_t> offset_table::offset_of(
    const std::string_view name) const {
  auto it = std::find_if(std::begin(entries_), std::end(entries_),
                         [&](const auto& entry) { return entry.name == name; });
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return it->offset;
}

build_result<library_t> offset_table::verify(const assembly_t& assembly) const {
  for (const auto& entry : entries_) {
    if (auto label = find_label(assembly, entry.name);
        label && *label != entry.offset) {
      auto failure = make_build_failure<library_t>(
          build_error_code::label_offset_mismatch,
          fmt::format("subroutine '{}' recorded at 0x{:04X} but assembled at "
                      "0x{:04X}",
                      entry.name, entry.offset, *label));
      spdlog::warn("Offset table rejected: {}", failure.info);
      return failure;
    }
    auto site = verify_site(assembly.library, entry.offset, entry.opcode);
    if (!site) {
      site.info = fmt::format("subroutine '{}': {}", entry.name, site.info);
      spdlog::warn("Offset table rejected: {}", site.info);
      return forward_failure<library_t>(site);
    }
  }
  return make_build_success(assembly.library);
}

build_result<opcode_t> verify_site(const library_t& library,
                                   const uint16_t offset,
                                   const std::optional<opcode_t> required) {
  if (offset >= library.code.size()) {
    return make_build_failure<opcode_t>(
        build_error_code::validator_offset_out_of_range,
        fmt::format("offset 0x{:04X} outside {}-byte code", offset,
                    library.code.size()));
  }
  auto decoded = disassemble(
      bytes_view_t{library.code.data(), library.code.size()});
  if (!decoded) {
    return forward_failure<opcode_t>(decoded);
  }
  auto it = std::find_if(
      std::begin(*decoded.value), std::end(*decoded.value),
      [&](const auto& located) { return located.offset == offset; });
  if (it == std::end(*decoded.value)) {
    return make_build_failure<opcode_t>(
        build_error_code::validator_offset_out_of_range,
        fmt::format("offset 0x{:04X} is inside an instruction", offset));
  }
  auto found = opcode_of(it->instruction);
  if (required && found != *required) {
    return make_build_failure<opcode_t>(
        build_error_code::validator_opcode_mismatch,
        fmt::format("expected '{}' at 0x{:04X}, found '{}'",
                    to_string(*required), offset, to_string(found)));
  }
  return make_build_success(found);
}

}  // namespace schemata::isa
