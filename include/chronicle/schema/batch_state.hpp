#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Batch anchoring lifecycle. Values are persisted; do not renumber.
namespace chronicle::schema {

enum class batch_state_t : uint8_t {
  unsubmitted = 0,
  submitted = 1,
  confirmed = 2,
  failed = 3
};

inline constexpr auto kBatchStateMappings =
    std::array{std::pair<std::string_view, batch_state_t>{
                   "unsubmitted", batch_state_t::unsubmitted},
               std::pair<std::string_view, batch_state_t>{
                   "submitted", batch_state_t::submitted},
               std::pair<std::string_view, batch_state_t>{
                   "confirmed", batch_state_t::confirmed},
               std::pair<std::string_view, batch_state_t>{
                   "failed", batch_state_t::failed}};

template <>
inline std::optional<batch_state_t> try_from_string<batch_state_t>(
    const std::string_view value) {
  return from_string(value, kBatchStateMappings);
}

inline constexpr std::string_view to_string(const batch_state_t value) {
  return to_string(value, kBatchStateMappings).value_or("unknown");
}

inline constexpr std::optional<batch_state_t> try_make_batch_state(
    const uint8_t raw) {
  if (raw > static_cast<uint8_t>(batch_state_t::failed)) {
    return std::nullopt;
  }
  return static_cast<batch_state_t>(raw);
}

/// Forward-only lifecycle; `failed` may only move back to `unsubmitted`.
/// Same-state moves are legal for `confirmed` (idempotent confirmation) and
/// `failed` (reason update).
inline constexpr bool is_valid_transition(const batch_state_t from,
                                          const batch_state_t to) {
  switch (from) {
    case batch_state_t::unsubmitted:
      return to == batch_state_t::submitted || to == batch_state_t::failed;
    case batch_state_t::submitted:
      return to == batch_state_t::confirmed || to == batch_state_t::failed;
    case batch_state_t::confirmed:
      return to == batch_state_t::confirmed;
    case batch_state_t::failed:
      return to == batch_state_t::unsubmitted || to == batch_state_t::failed;
  }
  return false;
}

}  // namespace chronicle::schema
