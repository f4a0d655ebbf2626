#include <fmt/format.h>
#include <schemata/isa/opcode.hpp>
#include <schemata/isa/parser.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <system_error>

using namespace schemata::schema;

namespace schemata::isa {

namespace {

using statements_t = std::vector<statement_t>;

std::string_view trim(std::string_view text) {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool is_identifier(const std::string_view text) {
  if (text.empty() ||
      (std::isalpha(static_cast<unsigned char>(text.front())) == 0 &&
       text.front() != '_')) {
    return false;
  }
  for (const auto ch : text) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

// nullopt: not a number at all. Values are parsed wide so that anything past
// 16 bits is reported as out of range rather than malformed.
std::optional<uint64_t> parse_number(std::string_view text) {
  auto base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    base = 16;
  }
  if (text.empty()) {
    return std::nullopt;
  }
  auto value = uint64_t{};
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value, base);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

class line_parser final {
 public:
  explicit line_parser(std::size_t line) : line_(line) {}

  build_result<uint16_t> immediate(const std::string_view text) const {
    auto value = parse_operand(text);
    if (!value) {
      return fail<uint16_t>(value.code, value.info);
    }
    return value;
  }

  build_result<jump_target_t> target(const std::string_view text) const {
    if (is_identifier(text)) {
      return make_build_success(jump_target_t{std::string{text}});
    }
    auto value = immediate(text);
    if (!value) {
      return forward_failure<jump_target_t>(value);
    }
    return make_build_success(jump_target_t{*value.value});
  }

  build_result<instruction_t> instruction(const std::string_view text) const {
    auto split = text.find_first_of(" \t");
    auto mnemonic = text.substr(0, split);
    auto rest = split == std::string_view::npos ? std::string_view{}
                                                : trim(text.substr(split));

    auto info = find_mnemonic(mnemonic);
    if (!info) {
      return fail<instruction_t>(
          build_error_code::malformed_instruction,
          fmt::format("unknown mnemonic '{}'", mnemonic));
    }

    auto operands = std::vector<std::string_view>{};
    if (!rest.empty()) {
      while (true) {
        auto comma = rest.find(',');
        auto operand = trim(rest.substr(0, comma));
        if (operand.empty()) {
          return fail<instruction_t>(
              build_error_code::malformed_instruction,
              fmt::format("'{}' has an empty operand", mnemonic));
        }
        operands.push_back(operand);
        if (comma == std::string_view::npos) {
          break;
        }
        rest = rest.substr(comma + 1);
      }
    }
    if (operands.size() != operand_count(info->layout)) {
      return fail<instruction_t>(
          build_error_code::malformed_instruction,
          fmt::format("'{}' takes {} operand(s), got {}", mnemonic,
                      operand_count(info->layout), operands.size()));
    }

    switch (info->opcode) {
      case opcode_t::fail:
        return make_build_success(instruction_t{fail_t{}});
      case opcode_t::succ:
        return make_build_success(instruction_t{succ_t{}});
      case opcode_t::ret:
        return make_build_success(instruction_t{ret_t{}});
      case opcode_t::jmp:
      case opcode_t::jif:
      case opcode_t::routine: {
        auto to = target(operands[0]);
        if (!to) {
          return forward_failure<instruction_t>(to);
        }
        if (info->opcode == opcode_t::jmp) {
          return make_build_success(instruction_t{jmp_t{*to.value}});
        }
        if (info->opcode == opcode_t::jif) {
          return make_build_success(instruction_t{jif_t{*to.value}});
        }
        return make_build_success(instruction_t{routine_t{*to.value}});
      }
      case opcode_t::pcvs:
      case opcode_t::pcas:
      case opcode_t::pcps: {
        auto family = immediate(operands[0]);
        if (!family) {
          return forward_failure<instruction_t>(family);
        }
        if (info->opcode == opcode_t::pcvs) {
          return make_build_success(instruction_t{pcvs_t{*family.value}});
        }
        if (info->opcode == opcode_t::pcas) {
          return make_build_success(instruction_t{pcas_t{*family.value}});
        }
        return make_build_success(instruction_t{pcps_t{*family.value}});
      }
      case opcode_t::pccs: {
        auto upper = immediate(operands[0]);
        if (!upper) {
          return forward_failure<instruction_t>(upper);
        }
        auto lower = immediate(operands[1]);
        if (!lower) {
          return forward_failure<instruction_t>(lower);
        }
        return make_build_success(
            instruction_t{pccs_t{*upper.value, *lower.value}});
      }
    }
    return fail<instruction_t>(build_error_code::malformed_instruction,
                               fmt::format("unsupported '{}'", mnemonic));
  }

 private:
  template <typename T>
  build_result<T> fail(const build_error_code code,
                       const std::string& what) const {
    return make_build_failure<T>(code,
                                 fmt::format("line {}: {}", line_, what));
  }

  std::size_t line_;
};

}  // namespace

build_result<uint16_t> parse_operand(const std::string_view text) {
  auto value = parse_number(trim(text));
  if (!value) {
    return make_build_failure<uint16_t>(
        build_error_code::malformed_instruction,
        fmt::format("'{}' is not a number", text));
  }
  if (*value > std::numeric_limits<uint16_t>::max()) {
    return make_build_failure<uint16_t>(
        build_error_code::operand_out_of_range,
        fmt::format("operand {} does not fit 16 bits", text));
  }
  return make_build_success(static_cast<uint16_t>(*value));
}

build_result<statements_t> parse_assembly(const std::string_view source) {
  auto statements = statements_t{};
  auto line_number = std::size_t{0};
  auto rest = source;
  while (!rest.empty() || line_number == 0) {
    ++line_number;
    auto newline = rest.find('\n');
    auto line = rest.substr(0, newline);
    rest = newline == std::string_view::npos ? std::string_view{}
                                             : rest.substr(newline + 1);

    if (auto comment = line.find("//"); comment != std::string_view::npos) {
      line = line.substr(0, comment);
    }

    auto parser = line_parser{line_number};
    while (!line.empty()) {
      auto semicolon = line.find(';');
      auto text = trim(line.substr(0, semicolon));
      line = semicolon == std::string_view::npos ? std::string_view{}
                                                 : line.substr(semicolon + 1);

      // Labels may share a statement with the instruction they mark.
      while (true) {
        auto colon = text.find(':');
        if (colon == std::string_view::npos) {
          break;
        }
        auto name = trim(text.substr(0, colon));
        if (!is_identifier(name)) {
          return make_build_failure<statements_t>(
              build_error_code::malformed_instruction,
              fmt::format("line {}: invalid label '{}'", line_number, name));
        }
        statements.emplace_back(label_t{std::string{name}});
        text = trim(text.substr(colon + 1));
      }
      if (text.empty()) {
        continue;
      }

      auto instruction = parser.instruction(text);
      if (!instruction) {
        return forward_failure<statements_t>(instruction);
      }
      statements.emplace_back(std::move(*instruction.value));
    }
  }
  return make_build_success(std::move(statements));
}

}  // namespace schemata::isa
