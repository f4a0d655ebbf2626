#pragma once
#include <schemata/schema/primitives.hpp>
#include <optional>
#include <span>

namespace schemata::schema::encoding {

// Codec selected at build time by tag, e.g.
//   auto enc = encoder<scale_encoder_tag>{};
// Content ids and round-trip fidelity depend on the exact bytes produced, so
// every artifact of one package must go through the same codec.
template <typename Library>
struct encoder {
  template <typename T>
  schemata::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, schemata::schema::bytes_t& out);

  template <typename T>
  T decode(const schemata::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const schemata::schema::bytes_view_t& bytes);
};

}  // namespace schemata::schema::encoding
