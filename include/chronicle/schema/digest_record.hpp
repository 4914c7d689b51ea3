#pragma once
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Persisted digest row. `batch` is the foreign key into the batch keyspace and
// is only ever written in the same write set as the batch it names.
namespace chronicle::schema {

template <uint16_t Version>
struct digest_record;

template <>
struct digest_record<1> final {
  uint16_t version{1};
  digest_t digest{};
  sequence_t sequence{};
  timestamp_seconds_t submitted_at{};
  timestamp_seconds_t collection{};
  std::optional<root_t> batch;
};

using digest_record_t = digest_record<1>;

}  // namespace chronicle::schema
