#include <schemata/blake3/hash.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/schema/identity.hpp>

#include <iterator>

namespace schemata::schema {

namespace {

using encoder_t = schemata::schema::encoding::encoder<
    schemata::schema::encoding::scale_encoder_tag>;

template <typename T>
hash32_t commit(const std::string_view& tag, const T& record) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(record);
  return schemata::blake3::tagged_hash(
      tag, bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace

library_id_t library_id(const library_t& library) {
  return commit(kLibraryIdTag, library);
}

schema_id_t schema_id(const schema_t& schema) {
  return commit(kSchemaIdTag, schema);
}

iface_id_t iface_id(const iface_t& iface) {
  return commit(kIfaceIdTag, iface);
}

sem_id_t sem_id(const std::string_view name, const std::string_view layout) {
  auto material = make_bytes(name);
  material.push_back(0x00);
  material.insert(std::end(material), std::begin(layout), std::end(layout));
  return schemata::blake3::tagged_hash(
      kSemIdTag, bytes_view_t{material.data(), material.size()});
}

}  // namespace schemata::schema
