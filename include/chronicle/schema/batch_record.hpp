#pragma once
#include <chronicle/schema/batch_state.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::schema {

template <uint16_t Version>
struct batch_record;

template <>
struct batch_record<1> final {
  uint16_t version{1};
  root_t root{};
  std::vector<digest_t> members;  // submission order
  batch_state_t state{batch_state_t::unsubmitted};
  timestamp_seconds_t closed_at{};
  std::optional<std::string> tx_id;
  std::optional<int64_t> confirmed_height;
  std::optional<timestamp_seconds_t> confirmed_at;
  std::optional<std::string> failure_reason;
  uint32_t submit_attempts{};
};

using batch_record_t = batch_record<1>;

}  // namespace chronicle::schema
