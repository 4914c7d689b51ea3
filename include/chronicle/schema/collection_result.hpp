#pragma once

#include <chronicle/schema/digest_record.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace chronicle::schema {

template <uint16_t Version>
struct collection_result;

template <>
struct collection_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  timestamp_seconds_t collection{};
  std::vector<digest_record_t> digests;
};

using collection_result_t = collection_result<1>;

}  // namespace chronicle::schema
