#pragma once
#include <schemata/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: library.
// Immutable bytecode module. Identity is the content hash of the whole
// record, so two libraries with the same stream share one id.
namespace schemata::schema {

template <uint16_t Version>
struct library;

template <>
struct library<1> final {
  uint16_t version{1};
  // ISA extension set the code was assembled for, e.g. "CTRL+COMMIT".
  std::string isa;
  bytes_t code;
  bytes_t data;
  // must be sorted
  std::vector<library_id_t> libs;

  bool operator==(const library&) const = default;
};

using library_t = library<1>;

// Validator address: subroutine entry point inside a library.
struct lib_site_t final {
  library_id_t library_id{};
  uint16_t offset{};

  bool operator==(const lib_site_t&) const = default;
};

inline lib_site_t make_lib_site(const library_id_t& library_id,
                                const uint16_t offset) {
  return lib_site_t{.library_id = library_id, .offset = offset};
}

}  // namespace schemata::schema
