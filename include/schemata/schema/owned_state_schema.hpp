#pragma once
#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: owned state schema.
// State attached to a single assignment (e.g. an amount owned by a party).
namespace schemata::schema {

enum class owned_state_kind : uint8_t {
  declarative = 0,
  fungible = 1,
  structured = 2,
  attachment = 3,
};

template <>
struct enum_names<owned_state_kind> final {
  static constexpr auto kNames = std::array{
      enum_name_t<owned_state_kind>{"declarative",
                                    owned_state_kind::declarative},
      enum_name_t<owned_state_kind>{"fungible", owned_state_kind::fungible},
      enum_name_t<owned_state_kind>{"structured", owned_state_kind::structured},
      enum_name_t<owned_state_kind>{"attachment", owned_state_kind::attachment},
  };
};

inline constexpr std::string_view to_string(const owned_state_kind value) {
  return enum_name(value);
}

// Width of the amount hidden inside a fungible commitment.
enum class fungible_type : uint8_t {
  unsigned_64bit = 8,
};

struct owned_state_schema_t final {
  owned_state_kind kind{owned_state_kind::declarative};
  // fungible only
  fungible_type fungible{fungible_type::unsigned_64bit};
  // structured only
  std::optional<sem_id_t> sem_id;

  bool operator==(const owned_state_schema_t&) const = default;
};

inline owned_state_schema_t owned_declarative() {
  return owned_state_schema_t{.kind = owned_state_kind::declarative};
}

inline owned_state_schema_t owned_fungible(
    const fungible_type type = fungible_type::unsigned_64bit) {
  return owned_state_schema_t{.kind = owned_state_kind::fungible,
                              .fungible = type};
}

inline owned_state_schema_t owned_structured(const sem_id_t& sem_id) {
  return owned_state_schema_t{.kind = owned_state_kind::structured,
                              .sem_id = sem_id};
}

inline owned_state_schema_t owned_attachment() {
  return owned_state_schema_t{.kind = owned_state_kind::attachment};
}

}  // namespace schemata::schema
