#pragma once
#include <schemata/schema/build_result.hpp>
#include <schemata/schema/iface.hpp>
#include <schemata/schema/iface_impl.hpp>
#include <schemata/schema/schema.hpp>

#include <optional>
#include <string>
#include <vector>

namespace schemata::builder {

/// Binds a built schema to an interface.
///
/// `build` requires that every mapped id exists in the schema, every mapped
/// name exists in the interface, every required interface field is mapped,
/// and each mapping agrees in shape (single vs. multiple global state,
/// semantic type, owned-state kind). The timestamp defaults to the current
/// time when none is given.
class iface_impl_builder final {
 public:
  iface_impl_builder(schemata::schema::schema_t schema,
                     schemata::schema::iface_t iface);

  iface_impl_builder& developer(schemata::schema::identity_t developer);
  iface_impl_builder& timestamp(schemata::schema::timestamp_seconds_t seconds);
  iface_impl_builder& version(schemata::schema::ver_no_t version);

  iface_impl_builder& map_global_state(schemata::schema::global_state_type_t id,
                                       std::string name);
  iface_impl_builder& map_assignment(schemata::schema::assignment_type_t id,
                                     std::string name);
  iface_impl_builder& map_transition(schemata::schema::transition_type_t id,
                                     std::string name);

  schemata::schema::build_result<schemata::schema::iface_impl_t> build() const;

 private:
  schemata::schema::schema_t schema_;
  schemata::schema::iface_t iface_;
  schemata::schema::identity_t developer_;
  std::optional<schemata::schema::timestamp_seconds_t> timestamp_;
  schemata::schema::ver_no_t version_{schemata::schema::ver_no_t::v1};
  std::vector<schemata::schema::named_field_t> global_state_;
  std::vector<schemata::schema::named_field_t> assignments_;
  std::vector<schemata::schema::named_field_t> transitions_;
};

}  // namespace schemata::builder
