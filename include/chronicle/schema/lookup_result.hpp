#pragma once

#include <chronicle/schema/batch_state.hpp>
#include <chronicle/schema/inclusion_proof.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Status of one digest as reported to the submission front door. The proof is
// regenerated from the batch members on every lookup.
namespace chronicle::schema {

template <uint16_t Version>
struct lookup_result;

template <>
struct lookup_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  bool found{};
  digest_t digest{};
  timestamp_seconds_t submitted_at{};
  timestamp_seconds_t collection{};
  std::optional<root_t> batch;
  std::optional<batch_state_t> state;
  std::optional<std::string> tx_id;
  std::optional<int64_t> confirmed_height;
  std::optional<timestamp_seconds_t> confirmed_at;
  inclusion_proof_t proof;
};

using lookup_result_t = lookup_result<1>;

}  // namespace chronicle::schema
