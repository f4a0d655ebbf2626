#include <blake3.h>
#include <schemata/blake3/hash.hpp>

namespace schemata::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
  }

  schemata::schema::hash32_t finalize() {
    auto output = schemata::schema::hash32_t{};
    // BLAKE3_OUT_LEN
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

schemata::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

schemata::schema::hash32_t hash(const schemata::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

schemata::schema::hash32_t tagged_hash(
    const std::string_view& tag,
    const schemata::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(tag.data(), tag.size());
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

}  // namespace schemata::blake3
