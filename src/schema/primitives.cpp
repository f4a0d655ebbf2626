#include <boost/algorithm/hex.hpp>
#include <schemata/schema/primitives.hpp>

#include <cctype>
#include <iterator>

namespace schemata::schema {

namespace {

constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

}  // namespace

bytes_t make_bytes(const std::string_view& text) {
  return bytes_t{std::begin(text), std::end(text)};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex_lower(std::begin(bytes), std::end(bytes),
                              std::back_inserter(out));
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  auto out = bytes_t{};
  out.reserve(hex.size() / 2);
  try {
    boost::algorithm::unhex(std::begin(hex), std::end(hex),
                            std::back_inserter(out));
  } catch (const boost::algorithm::hex_decode_error&) {
    return std::nullopt;
  }
  return out;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  auto buffer = uint32_t{0};
  auto bits = 0u;
  for (const auto byte : bytes) {
    buffer = (buffer << 8u) | byte;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kBase64Alphabet[(buffer >> bits) & 0x3Fu]);
    }
  }
  if (bits > 0) {
    out.push_back(kBase64Alphabet[(buffer << (6 - bits)) & 0x3Fu]);
  }
  while ((out.size() % 4) != 0) {
    out.push_back('=');
  }
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto out = bytes_t{};
  out.reserve((encoded.size() / 4) * 3);
  auto buffer = uint32_t{0};
  auto bits = 0u;
  auto symbols = std::size_t{0};
  auto padding = std::size_t{0};
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    ++symbols;
    if (ch == '=') {
      ++padding;
      continue;
    }
    auto value = kBase64Alphabet.find(ch);
    if (padding > 0 || value == std::string_view::npos) {
      return std::nullopt;
    }
    buffer = (buffer << 6u) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFFu));
    }
  }
  if ((symbols % 4) != 0 || padding > 2) {
    return std::nullopt;
  }
  return out;
}

}  // namespace schemata::schema
