#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct put_result;

template <>
struct put_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  bool already_existed{};
  std::optional<root_t> batch;
  timestamp_seconds_t collection{};
  sequence_t sequence{};
};

using put_result_t = put_result<1>;

}  // namespace chronicle::schema
