#pragma once
#include <schemata/schema/owned_state_schema.hpp>
#include <schemata/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: interface.
// Abstract capability contract a schema can be bound to. Names the
// categories of global state, assignments and transitions an implementation
// must (or may) provide.
namespace schemata::schema {

struct global_iface_t final {
  std::string name;
  // When set, the bound global slot must carry exactly this semantic type.
  std::optional<sem_id_t> sem_id;
  bool required{true};
  bool multiple{false};

  bool operator==(const global_iface_t&) const = default;
};

struct assignment_iface_t final {
  std::string name;
  owned_state_kind kind{owned_state_kind::fungible};
  bool required{true};
  bool multiple{true};

  bool operator==(const assignment_iface_t&) const = default;
};

struct transition_iface_t final {
  std::string name;
  bool required{true};

  bool operator==(const transition_iface_t&) const = default;
};

template <uint16_t Version>
struct iface;

template <>
struct iface<1> final {
  uint16_t version{1};
  std::string name;
  std::vector<global_iface_t> global_state;
  std::vector<assignment_iface_t> assignments;
  std::vector<transition_iface_t> transitions;

  bool operator==(const iface&) const = default;
};

using iface_t = iface<1>;

}  // namespace schemata::schema
