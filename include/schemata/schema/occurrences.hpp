#pragma once

#include <schemata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: occurrences.
// Cardinality rule for how many times a slot may appear in one operation.
namespace schemata::schema {

enum class occurrences_kind : uint8_t {
  none_or_once = 0,
  once = 1,
  none_or_more = 2,
  once_or_more = 3,
  none_or_up_to = 4,
  once_or_up_to = 5,
};

template <>
struct enum_names<occurrences_kind> final {
  static constexpr auto kNames = std::array{
      enum_name_t<occurrences_kind>{"none_or_once",
                                    occurrences_kind::none_or_once},
      enum_name_t<occurrences_kind>{"once", occurrences_kind::once},
      enum_name_t<occurrences_kind>{"none_or_more",
                                    occurrences_kind::none_or_more},
      enum_name_t<occurrences_kind>{"once_or_more",
                                    occurrences_kind::once_or_more},
      enum_name_t<occurrences_kind>{"none_or_up_to",
                                    occurrences_kind::none_or_up_to},
      enum_name_t<occurrences_kind>{"once_or_up_to",
                                    occurrences_kind::once_or_up_to},
  };
};

inline constexpr std::string_view to_string(const occurrences_kind value) {
  return enum_name(value);
}

struct occurrences_t final {
  occurrences_kind kind{occurrences_kind::once};
  // Upper bound, meaningful for the *_up_to kinds only.
  uint16_t up_to{};

  bool operator==(const occurrences_t&) const = default;
};

inline constexpr occurrences_t occurs_none_or_once() {
  return occurrences_t{.kind = occurrences_kind::none_or_once};
}

inline constexpr occurrences_t occurs_once() {
  return occurrences_t{.kind = occurrences_kind::once};
}

inline constexpr occurrences_t occurs_none_or_more() {
  return occurrences_t{.kind = occurrences_kind::none_or_more};
}

inline constexpr occurrences_t occurs_once_or_more() {
  return occurrences_t{.kind = occurrences_kind::once_or_more};
}

inline constexpr occurrences_t occurs_none_or_up_to(const uint16_t max) {
  return occurrences_t{.kind = occurrences_kind::none_or_up_to, .up_to = max};
}

inline constexpr occurrences_t occurs_once_or_up_to(const uint16_t max) {
  return occurrences_t{.kind = occurrences_kind::once_or_up_to, .up_to = max};
}

inline constexpr uint16_t min_value(const occurrences_t& o) {
  switch (o.kind) {
    case occurrences_kind::none_or_once:
    case occurrences_kind::none_or_more:
    case occurrences_kind::none_or_up_to:
      return 0;
    case occurrences_kind::once:
    case occurrences_kind::once_or_more:
    case occurrences_kind::once_or_up_to:
      return 1;
  }
  return 0;
}

// nullopt for the *_or_more kinds, which have no upper bound.
inline constexpr std::optional<uint16_t> max_value(const occurrences_t& o) {
  switch (o.kind) {
    case occurrences_kind::none_or_once:
    case occurrences_kind::once:
      return uint16_t{1};
    case occurrences_kind::none_or_more:
    case occurrences_kind::once_or_more:
      return std::nullopt;
    case occurrences_kind::none_or_up_to:
    case occurrences_kind::once_or_up_to:
      return o.up_to;
  }
  return uint16_t{0};
}

inline constexpr bool has_up_to(const occurrences_kind kind) {
  return kind == occurrences_kind::none_or_up_to ||
         kind == occurrences_kind::once_or_up_to;
}

// Clears `up_to` where the kind ignores it, so equal rules encode (and hash)
// the same.
inline constexpr occurrences_t normalized(const occurrences_t& o) {
  return occurrences_t{.kind = o.kind, .up_to = has_up_to(o.kind) ? o.up_to
                                                                 : uint16_t{0}};
}

// False for a rule no count can meet, e.g. once_or_up_to(0).
inline constexpr bool is_satisfiable(const occurrences_t& o) {
  auto max = max_value(o);
  return !max || *max >= min_value(o);
}

// True when `count` items satisfy the constraint. Enforcement belongs to the
// validation layer; the schema only has to declare the rule faithfully.
inline constexpr bool check(const occurrences_t& o, const uint64_t count) {
  auto max = max_value(o);
  return count >= min_value(o) && (!max || count <= *max);
}

}  // namespace schemata::schema
