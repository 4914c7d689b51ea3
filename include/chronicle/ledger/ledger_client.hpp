#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <functional>
#include <string>

// Narrow capability the anchoring engine needs from a ledger-writing client.
// A non-zero `code` is a transient failure; callers retry on a later tick.
namespace chronicle::ledger {

struct submit_result final {
  uint32_t code{};
  std::string log;
  std::string tx_id;
};

struct query_result final {
  uint32_t code{};
  std::string log;
  bool confirmed{};
  int64_t height{};
  chronicle::schema::timestamp_seconds_t timestamp{};
};

using submit_fn_t =
    std::function<submit_result(const chronicle::schema::root_t& root)>;
using query_fn_t = std::function<query_result(const std::string& tx_id)>;

struct ledger_client final {
  submit_fn_t submit;
  query_fn_t query;
};

}  // namespace chronicle::ledger
