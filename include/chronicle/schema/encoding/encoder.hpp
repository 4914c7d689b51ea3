#pragma once
#include <chronicle/schema/primitives.hpp>
#include <optional>

namespace chronicle::schema::encoding {

// Stored records and the dump payload go through this front; the tag selects
// the wire format.
template <typename Library>
struct encoder {
  template <typename T>
  chronicle::schema::bytes_t encode(const T& obj);

  /// Nullopt on malformed or truncated input.
  template <typename T>
  std::optional<T> try_decode(const chronicle::schema::bytes_view_t& bytes);
};

}  // namespace chronicle::schema::encoding
