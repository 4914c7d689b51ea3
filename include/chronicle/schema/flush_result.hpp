#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Outcome of one scheduler tick.
namespace chronicle::schema {

template <uint16_t Version>
struct flush_result;

template <>
struct flush_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  bool skipped{};
  std::optional<root_t> root;
  uint64_t members{};
  uint32_t retried{};
  uint32_t submitted{};
  uint32_t failed{};
  uint32_t confirmed{};
};

using flush_result_t = flush_result<1>;

}  // namespace chronicle::schema
