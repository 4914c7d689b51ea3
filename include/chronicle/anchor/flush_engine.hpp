#pragma once

#include <chronicle/anchor/context.hpp>
#include <chronicle/schema/enum_string.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/flush_result.hpp>
#include <chronicle/schema/fsck_report.hpp>
#include <chronicle/schema/primitives.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <string_view>
#include <vector>

namespace chronicle::anchor {

enum class flush_phase_t : uint8_t {
  idle = 0,
  collecting = 1,
  building = 2,
  submitting = 3,
  awaiting_confirmation = 4
};

inline constexpr auto kFlushPhaseMappings = std::array{
    std::pair<std::string_view, flush_phase_t>{"idle", flush_phase_t::idle},
    std::pair<std::string_view, flush_phase_t>{"collecting",
                                               flush_phase_t::collecting},
    std::pair<std::string_view, flush_phase_t>{"building",
                                               flush_phase_t::building},
    std::pair<std::string_view, flush_phase_t>{"submitting",
                                               flush_phase_t::submitting},
    std::pair<std::string_view, flush_phase_t>{
        "awaiting_confirmation", flush_phase_t::awaiting_confirmation}};

inline constexpr std::string_view to_string(const flush_phase_t value) {
  return chronicle::schema::to_string(value, kFlushPhaseMappings)
      .value_or("unknown");
}

struct confirmation_summary final {
  chronicle::schema::error_code code{chronicle::schema::error_code::ok};
  uint32_t queried{};
  uint32_t confirmed{};
  uint32_t unconfirmed{};
};

/// Query the ledger for every submitted batch and advance the ones it reports
/// as confirmed. Query failures leave the batch untouched. When `findings` is
/// set, failures and conflicts are appended to it.
confirmation_summary poll_confirmations(
    context& ctx,
    std::vector<chronicle::schema::fsck_finding>* findings);

/// Single-writer batch closure state machine driven once per scheduler tick.
class flush_engine final {
 public:
  explicit flush_engine(context& ctx);

  /// Run one cycle: resubmit batches awaiting submission, close pending
  /// digests into a new batch, submit it, then poll confirmations. A call
  /// that finds another cycle running returns at once with
  /// `flush_in_progress` and `skipped` set.
  chronicle::schema::flush_result_t flush();

  flush_phase_t phase() const;

 private:
  void resubmit(chronicle::schema::flush_result_t& result);
  void close_batch(chronicle::schema::timestamp_seconds_t now,
                   chronicle::schema::flush_result_t& result);
  void submit(const chronicle::schema::root_t& root,
              chronicle::schema::flush_result_t& result);

  context& context_;
  std::atomic<flush_phase_t> phase_{flush_phase_t::idle};
};

}  // namespace chronicle::anchor
