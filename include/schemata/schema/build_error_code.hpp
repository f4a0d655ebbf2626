#pragma once

#include <schemata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace schemata::schema {

enum class build_error_code : uint32_t {
  ok = 0,
  malformed_instruction = 1,
  operand_out_of_range = 2,
  code_too_large = 3,
  validator_opcode_mismatch = 10,
  validator_offset_out_of_range = 11,
  label_offset_mismatch = 12,
  duplicate_global_state = 20,
  duplicate_owned_state = 21,
  duplicate_transition = 22,
  unknown_global_state = 23,
  unknown_owned_state = 24,
  unknown_type = 25,
  missing_genesis = 26,
  duplicate_genesis = 27,
  unsatisfiable_occurrences = 28,
  missing_library = 30,
  schema_id_mismatch = 31,
  malformed_script_set = 32,
  unknown_binding_id = 40,
  unknown_interface_field = 41,
  duplicate_binding = 42,
  interface_category_missing = 43,
  interface_shape_mismatch = 44,
};

template <>
struct enum_names<build_error_code> final {
  static constexpr auto kNames = std::array{
      enum_name_t<build_error_code>{"ok", build_error_code::ok},
      enum_name_t<build_error_code>{"malformed_instruction",
                                    build_error_code::malformed_instruction},
      enum_name_t<build_error_code>{"operand_out_of_range",
                                    build_error_code::operand_out_of_range},
      enum_name_t<build_error_code>{"code_too_large",
                                    build_error_code::code_too_large},
      enum_name_t<build_error_code>{"validator_opcode_mismatch",
                                    build_error_code::validator_opcode_mismatch},
      enum_name_t<build_error_code>{"validator_offset_out_of_range",
                                    build_error_code::validator_offset_out_of_range},
      enum_name_t<build_error_code>{"label_offset_mismatch",
                                    build_error_code::label_offset_mismatch},
      enum_name_t<build_error_code>{"duplicate_global_state",
                                    build_error_code::duplicate_global_state},
      enum_name_t<build_error_code>{"duplicate_owned_state",
                                    build_error_code::duplicate_owned_state},
      enum_name_t<build_error_code>{"duplicate_transition",
                                    build_error_code::duplicate_transition},
      enum_name_t<build_error_code>{"unknown_global_state",
                                    build_error_code::unknown_global_state},
      enum_name_t<build_error_code>{"unknown_owned_state",
                                    build_error_code::unknown_owned_state},
      enum_name_t<build_error_code>{"unknown_type",
                                    build_error_code::unknown_type},
      enum_name_t<build_error_code>{"missing_genesis",
                                    build_error_code::missing_genesis},
      enum_name_t<build_error_code>{"duplicate_genesis",
                                    build_error_code::duplicate_genesis},
      enum_name_t<build_error_code>{"unsatisfiable_occurrences",
                                    build_error_code::unsatisfiable_occurrences},
      enum_name_t<build_error_code>{"missing_library",
                                    build_error_code::missing_library},
      enum_name_t<build_error_code>{"schema_id_mismatch",
                                    build_error_code::schema_id_mismatch},
      enum_name_t<build_error_code>{"malformed_script_set",
                                    build_error_code::malformed_script_set},
      enum_name_t<build_error_code>{"unknown_binding_id",
                                    build_error_code::unknown_binding_id},
      enum_name_t<build_error_code>{"unknown_interface_field",
                                    build_error_code::unknown_interface_field},
      enum_name_t<build_error_code>{"duplicate_binding",
                                    build_error_code::duplicate_binding},
      enum_name_t<build_error_code>{"interface_category_missing",
                                    build_error_code::interface_category_missing},
      enum_name_t<build_error_code>{"interface_shape_mismatch",
                                    build_error_code::interface_shape_mismatch},
  };
};

inline constexpr std::string_view to_string(const build_error_code value) {
  return enum_name(value);
}

}  // namespace schemata::schema
