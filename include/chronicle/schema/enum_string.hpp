#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for enums that appear in logs, fsck output and the human dump.
// Each enum keeps its table beside its definition and specializes
// `try_from_string` from it.
namespace chronicle::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::ranges::find(mappings, value,
                                 &std::pair<std::string_view, Enum>::first);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::ranges::find(mappings, value,
                                 &std::pair<std::string_view, Enum>::second);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->first;
}

template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace chronicle::schema
