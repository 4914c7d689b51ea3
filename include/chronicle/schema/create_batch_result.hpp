#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct create_batch_result;

template <>
struct create_batch_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  root_t root{};
};

using create_batch_result_t = create_batch_result<1>;

}  // namespace chronicle::schema
