#pragma once

#include <chronicle/schema/error_code.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

// Result envelope for mutations that return nothing but success or failure.
namespace chronicle::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_operation_result(const error_code code,
                                                std::string log,
                                                const std::string_view codespace) {
  return operation_result_t{.code = to_code(code),
                            .log = std::move(log),
                            .codespace = std::string{codespace}};
}

}  // namespace chronicle::schema
