#pragma once
#include <schemata/common/critical.hpp>
#include <schemata/schema/encoding/encoder.hpp>
#include <schemata/schema/encoding/scale/iface_impl.hpp>
#include <schemata/schema/encoding/scale/occurrences.hpp>
#include <schemata/schema/encoding/scale/opcode.hpp>
#include <schemata/schema/encoding/scale/owned_state_schema.hpp>
#include <schemata/schema/iface.hpp>
#include <schemata/schema/library.hpp>
#include <schemata/schema/package.hpp>
#include <schemata/schema/schema.hpp>
#include <schemata/schema/type_system.hpp>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>

namespace schemata::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  schemata::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, schemata::schema::bytes_t& out);

  template <typename T>
  T decode(const schemata::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const schemata::schema::bytes_view_t& bytes);
};

template <typename T>
schemata::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    schemata::common::critical("SCALE encoding failed: {}",
                               encoded.error().message());
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        schemata::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const schemata::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    schemata::common::critical("SCALE decoding of {} bytes failed: {}",
                               bytes.size(), decoded.error().message());
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const schemata::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return decoded.value();
  } catch (const std::exception&) {
    // Malformed input raised by the codec itself; reported as absent.
    return std::nullopt;
  }
}

}  // namespace schemata::schema::encoding
