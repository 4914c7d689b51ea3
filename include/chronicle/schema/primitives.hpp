#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using digest_t = hash32_t;  // Client supplied content hash
using root_t = hash32_t;    // Merkle root of a batch, primary batch identifier
using timestamp_seconds_t = int64_t;
using sequence_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Exactly 32 raw bytes, as stored in index values and key suffixes.
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);

/// Exactly 64 hex digits, optionally prefixed with `0x`. Either case.
std::optional<hash32_t> try_parse_hash32(std::string_view hex);

/// Lowercase, unprefixed.
std::string to_hex(const bytes_view_t& bytes);

}  // namespace chronicle::schema
