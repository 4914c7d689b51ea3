#pragma once

#include <chronicle/schema/batch_record.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Most recently submitted batch, as reported to the submission front door.
namespace chronicle::schema {

template <uint16_t Version>
struct last_anchor_result;

template <>
struct last_anchor_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<batch_record_t> batch;
};

using last_anchor_result_t = last_anchor_result<1>;

}  // namespace chronicle::schema
