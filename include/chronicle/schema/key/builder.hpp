#pragma once
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace chronicle::schema::key {

/// Assembles RocksDB keys so that byte order matches the order the stores
/// iterate in: integers big-endian, signed timestamps with the sign bit
/// flipped so earlier seconds sort first.
struct builder final {
  chronicle::schema::bytes_t data;

  builder& write(const std::string_view& prefix);
  builder& write(const chronicle::schema::bytes_view_t& bytes);
  builder& write(const chronicle::schema::hash32_t& hash);
  builder& write(uint8_t tag);
  builder& write(uint64_t value);
  builder& write_timestamp(chronicle::schema::timestamp_seconds_t seconds);
};

}  // namespace chronicle::schema::key
