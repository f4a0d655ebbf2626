#pragma once
#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: interface implementation.
// Binds schema-internal ids to the field names an interface expects.
// Carries a creation timestamp, so it is descriptive metadata rather than a
// content-addressed artifact.
namespace schemata::schema {

enum class ver_no_t : uint8_t {
  v1 = 0,
};

template <>
struct enum_names<ver_no_t> final {
  static constexpr auto kNames = std::array{
      enum_name_t<ver_no_t>{"v1", ver_no_t::v1},
  };
};

inline constexpr std::string_view to_string(const ver_no_t value) {
  return enum_name(value);
}

struct named_field_t final {
  uint16_t id{};
  std::string name;

  bool operator==(const named_field_t&) const = default;
};

template <uint16_t Version>
struct iface_impl;

template <>
struct iface_impl<1> final {
  ver_no_t version{ver_no_t::v1};
  schema_id_t schema_id{};
  iface_id_t iface_id{};
  timestamp_seconds_t timestamp{};
  identity_t developer;
  // sorted by id
  std::vector<named_field_t> global_state;
  std::vector<named_field_t> assignments;
  std::vector<named_field_t> transitions;

  bool operator==(const iface_impl&) const = default;
};

using iface_impl_t = iface_impl<1>;

}  // namespace schemata::schema
