#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace schemata::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Content-derived identities.
using library_id_t = hash32_t;
using schema_id_t = hash32_t;
using iface_id_t = hash32_t;
using sem_id_t = hash32_t;

// Internal slot and transition identifiers. Scoped to the contract family
// that declares them.
using global_state_type_t = uint16_t;
using assignment_type_t = uint16_t;
using transition_type_t = uint16_t;

// Developer/author identity, e.g. "ssi:..." or an e-mail.
using identity_t = std::string;

using timestamp_seconds_t = int64_t;

bytes_t make_bytes(const std::string_view& text);

// Lowercase hex, no prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
// Accepts an optional 0x prefix and either case.
std::optional<bytes_t> try_from_hex(std::string_view hex);

// Padded standard alphabet; whitespace is ignored when decoding.
std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

}  // namespace schemata::schema
