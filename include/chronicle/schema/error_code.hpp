#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Failure taxonomy shared by every result envelope. Zero is success.
namespace chronicle::schema {

enum class error_code : uint32_t {
  ok = 0,
  storage_unavailable = 1,
  integrity_error = 2,
  duplicate_root = 3,
  conflicting_confirmation = 4,
  ledger_unavailable = 5,
  corrupt_batch = 6,
  stuck_digest = 7,
  batch_missing = 8,
  invalid_transition = 9,
  flush_in_progress = 10,
  invalid_argument = 11,
  unsupported = 12,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"storage_unavailable",
                                            error_code::storage_unavailable},
    std::pair<std::string_view, error_code>{"integrity_error",
                                            error_code::integrity_error},
    std::pair<std::string_view, error_code>{"duplicate_root",
                                            error_code::duplicate_root},
    std::pair<std::string_view, error_code>{
        "conflicting_confirmation", error_code::conflicting_confirmation},
    std::pair<std::string_view, error_code>{"ledger_unavailable",
                                            error_code::ledger_unavailable},
    std::pair<std::string_view, error_code>{"corrupt_batch",
                                            error_code::corrupt_batch},
    std::pair<std::string_view, error_code>{"stuck_digest",
                                            error_code::stuck_digest},
    std::pair<std::string_view, error_code>{"batch_missing",
                                            error_code::batch_missing},
    std::pair<std::string_view, error_code>{"invalid_transition",
                                            error_code::invalid_transition},
    std::pair<std::string_view, error_code>{"flush_in_progress",
                                            error_code::flush_in_progress},
    std::pair<std::string_view, error_code>{"invalid_argument",
                                            error_code::invalid_argument},
    std::pair<std::string_view, error_code>{"unsupported",
                                            error_code::unsupported}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace chronicle::schema
