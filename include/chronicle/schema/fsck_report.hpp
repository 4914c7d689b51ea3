#pragma once

#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace chronicle::schema {

struct fsck_options final {
  bool verbose{};
  bool print_hashes{};
  /// Re-query the ledger for submitted batches and advance confirmations.
  bool query_ledger{true};
  /// A pending digest older than `stuck_multiple` flush periods is reported.
  uint32_t stuck_multiple{24};
};

struct fsck_finding final {
  error_code code{error_code::ok};
  hash32_t subject{};  // batch root or digest, depending on `code`
  std::string detail;
};

template <uint16_t Version>
struct fsck_report;

template <>
struct fsck_report<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  uint64_t batches_checked{};
  uint64_t digests_checked{};
  uint64_t pending_digests{};
  uint32_t confirmations_advanced{};
  std::vector<fsck_finding> findings;
};

using fsck_report_t = fsck_report<1>;

}  // namespace chronicle::schema
