#include <boost/endian/conversion.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <schemata/isa/assembler.hpp>
#include <schemata/schema/identity.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <set>

using namespace schemata::schema;

namespace schemata::isa {

namespace {

void put_u16(bytes_t& code, const uint16_t value) {
  auto buffer = std::array<uint8_t, 2>{};
  boost::endian::store_little_u16(buffer.data(), value);
  code.insert(std::end(code), std::begin(buffer), std::end(buffer));
}

uint16_t get_u16(const bytes_view_t& code, const std::size_t at) {
  return boost::endian::load_little_u16(code.data() + at);
}

const jump_target_t* jump_target(const instruction_t& instruction) {
  return std::visit(
      overloaded{[](const jmp_t& i) -> const jump_target_t* { return &i.target; },
                 [](const jif_t& i) -> const jump_target_t* { return &i.target; },
                 [](const routine_t& i) -> const jump_target_t* {
                   return &i.target;
                 },
                 [](const auto&) -> const jump_target_t* { return nullptr; }},
      instruction);
}

// ISA extension string: the sorted set of extensions the code uses.
std::string isa_extensions(const std::set<std::string_view>& used) {
  auto isa = std::string{};
  for (const auto& extension : used) {
    if (!isa.empty()) {
      isa.push_back('+');
    }
    isa.append(extension);
  }
  return isa;
}

struct layout_t final {
  std::vector<std::pair<std::string, uint16_t>> labels;
  std::set<uint16_t> boundaries;
  std::size_t size{};
};

build_result<layout_t> lay_out(const std::vector<statement_t>& statements) {
  auto layout = layout_t{};
  auto instructions = std::size_t{0};
  for (const auto& statement : statements) {
    if (const auto* label = std::get_if<label_t>(&statement)) {
      if (label->name.empty()) {
        return make_build_failure<layout_t>(
            build_error_code::malformed_instruction, "empty label name");
      }
      auto duplicate = std::any_of(
          std::begin(layout.labels), std::end(layout.labels),
          [&](const auto& entry) { return entry.first == label->name; });
      if (duplicate) {
        return make_build_failure<layout_t>(
            build_error_code::malformed_instruction,
            fmt::format("label '{}' declared twice", label->name));
      }
      layout.labels.emplace_back(label->name,
                                 static_cast<uint16_t>(layout.size));
      continue;
    }
    const auto& instruction = std::get<instruction_t>(statement);
    auto size = instruction_size(opcode_of(instruction));
    if (layout.size + size > kMaxCodeSize) {
      return make_build_failure<layout_t>(
          build_error_code::code_too_large,
          fmt::format("code exceeds {} bytes at instruction {}", kMaxCodeSize,
                      instructions));
    }
    layout.boundaries.insert(static_cast<uint16_t>(layout.size));
    layout.size += size;
    ++instructions;
  }
  if (instructions == 0) {
    return make_build_failure<layout_t>(build_error_code::malformed_instruction,
                                        "program has no instructions");
  }
  return make_build_success(std::move(layout));
}

build_result<uint16_t> resolve(const jump_target_t& target,
                               const layout_t& layout) {
  auto offset = uint16_t{};
  if (const auto* name = std::get_if<std::string>(&target)) {
    auto it = std::find_if(
        std::begin(layout.labels), std::end(layout.labels),
        [&](const auto& entry) { return entry.first == *name; });
    if (it == std::end(layout.labels)) {
      return make_build_failure<uint16_t>(
          build_error_code::operand_out_of_range,
          fmt::format("jump to undeclared label '{}'", *name));
    }
    offset = it->second;
  } else {
    offset = std::get<uint16_t>(target);
  }
  if (!layout.boundaries.contains(offset)) {
    return make_build_failure<uint16_t>(
        build_error_code::operand_out_of_range,
        fmt::format("jump target 0x{:04X} is not an instruction in a {}-byte "
                    "stream",
                    offset, layout.size));
  }
  return make_build_success(offset);
}

}  // namespace

build_result<assembly_t> assemble(const std::vector<statement_t>& statements) {
  auto layout = lay_out(statements);
  if (!layout) {
    spdlog::warn("Assembly rejected: {} ({})", layout.log, layout.info);
    return forward_failure<assembly_t>(layout);
  }

  auto code = bytes_t{};
  code.reserve(layout.value->size);
  auto extensions = std::set<std::string_view>{};
  for (const auto& statement : statements) {
    const auto* instruction = std::get_if<instruction_t>(&statement);
    if (instruction == nullptr) {
      continue;
    }
    auto opcode = opcode_of(*instruction);
    extensions.insert(opcode_info(opcode).extension);
    code.push_back(static_cast<uint8_t>(opcode));

    if (const auto* target = jump_target(*instruction)) {
      auto resolved = resolve(*target, *layout.value);
      if (!resolved) {
        spdlog::warn("Assembly rejected: {} ({})", resolved.log,
                     resolved.info);
        return forward_failure<assembly_t>(resolved);
      }
      put_u16(code, *resolved.value);
      continue;
    }
    std::visit(overloaded{[&](const pcvs_t& i) { put_u16(code, i.family); },
                          [&](const pcas_t& i) { put_u16(code, i.family); },
                          [&](const pcps_t& i) { put_u16(code, i.family); },
                          [&](const pccs_t& i) {
                            put_u16(code, i.upper_bound);
                            put_u16(code, i.lower_bound);
                          },
                          [](const auto&) {}},
               *instruction);
  }

  auto assembly = assembly_t{};
  assembly.library = library_t{.version = 1,
                               .isa = isa_extensions(extensions),
                               .code = std::move(code),
                               .data = {},
                               .libs = {}};
  assembly.id = library_id(assembly.library);
  assembly.labels = std::move(layout.value->labels);
  spdlog::debug("Assembled {} byte library {}", assembly.library.code.size(),
                to_hex(assembly.id));
  return make_build_success(std::move(assembly));
}

build_result<assembly_t> assemble(
    const std::vector<instruction_t>& instructions) {
  auto statements = std::vector<statement_t>{};
  statements.reserve(instructions.size());
  for (const auto& instruction : instructions) {
    statements.emplace_back(instruction);
  }
  return assemble(statements);
}

build_result<std::vector<located_instruction_t>> disassemble(
    const bytes_view_t& code) {
  using result_t = std::vector<located_instruction_t>;
  if (code.size() > kMaxCodeSize) {
    return make_build_failure<result_t>(
        build_error_code::code_too_large,
        fmt::format("{} byte stream exceeds {} bytes", code.size(),
                    kMaxCodeSize));
  }

  auto out = result_t{};
  auto at = std::size_t{0};
  while (at < code.size()) {
    auto info = find_opcode(code[at]);
    if (!info) {
      return make_build_failure<result_t>(
          build_error_code::malformed_instruction,
          fmt::format("unknown opcode 0x{:02X} at 0x{:04X}", code[at], at));
    }
    auto size = instruction_size(info->opcode);
    if (at + size > code.size()) {
      return make_build_failure<result_t>(
          build_error_code::malformed_instruction,
          fmt::format("truncated '{}' at 0x{:04X}", info->mnemonic, at));
    }

    auto instruction = instruction_t{};
    switch (info->opcode) {
      case opcode_t::fail:
        instruction = fail_t{};
        break;
      case opcode_t::succ:
        instruction = succ_t{};
        break;
      case opcode_t::ret:
        instruction = ret_t{};
        break;
      case opcode_t::jmp:
        instruction = jmp_t{.target = get_u16(code, at + 1)};
        break;
      case opcode_t::jif:
        instruction = jif_t{.target = get_u16(code, at + 1)};
        break;
      case opcode_t::routine:
        instruction = routine_t{.target = get_u16(code, at + 1)};
        break;
      case opcode_t::pcvs:
        instruction = pcvs_t{.family = get_u16(code, at + 1)};
        break;
      case opcode_t::pcas:
        instruction = pcas_t{.family = get_u16(code, at + 1)};
        break;
      case opcode_t::pcps:
        instruction = pcps_t{.family = get_u16(code, at + 1)};
        break;
      case opcode_t::pccs:
        instruction = pccs_t{.upper_bound = get_u16(code, at + 1),
                             .lower_bound = get_u16(code, at + 3)};
        break;
    }
    out.push_back(located_instruction_t{.offset = static_cast<uint16_t>(at),
                                        .instruction = std::move(instruction)});
    at += size;
  }
  return make_build_success(std::move(out));
}

std::optional<uint16_t> find_label(const assembly_t& assembly,
                                   const std::string_view name) {
  for (const auto& [label, offset] : assembly.labels) {
    if (label == name) {
      return offset;
    }
  }
  return std::nullopt;
}

std::string listing(const std::vector<located_instruction_t>& instructions) {
  auto out = std::string{};
  for (const auto& located : instructions) {
    out += fmt::format("{:04X}  {}\n", located.offset,
                       to_string(located.instruction));
  }
  return out;
}

}  // namespace schemata::isa
