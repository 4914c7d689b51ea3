#include <spdlog/spdlog.h>
#include <chronicle/anchor/flush_engine.hpp>

#include <exception>
#include <mutex>
#include <string>
#include <utility>

using namespace chronicle::schema;

namespace {

constexpr auto kCodespace = std::string_view{"chronicle.flush"};

struct phase_guard final {
  std::atomic<chronicle::anchor::flush_phase_t>& phase;

  ~phase_guard() { phase = chronicle::anchor::flush_phase_t::idle; }
};

void record_failure(flush_result_t& result,
                    const error_code code,
                    std::string log) {
  if (result.code == 0) {
    result.code = to_code(code);
    result.log = std::move(log);
  }
}

}  // namespace

namespace chronicle::anchor {

confirmation_summary poll_confirmations(context& ctx,
                                        std::vector<fsck_finding>* findings) {
  auto summary = confirmation_summary{};
  auto roots = std::vector<root_t>{};
  summary.code = ctx.anchors.unconfirmed(roots);
  if (summary.code != error_code::ok) {
    spdlog::error("Failed listing unconfirmed batches: {}",
                  to_string(summary.code));
    return summary;
  }

  for (const auto& root : roots) {
    auto batch = std::optional<batch_record_t>{};
    auto code = ctx.anchors.get_batch(root, batch);
    if (code != error_code::ok || !batch.has_value()) {
      spdlog::error("Unconfirmed index names unreadable batch {}",
                    to_hex(root));
      if (findings != nullptr) {
        findings->push_back(fsck_finding{.code = error_code::batch_missing,
                                         .subject = root,
                                         .detail = "state index entry without "
                                                   "readable batch"});
      }
      continue;
    }
    if (batch->state != batch_state_t::submitted || !batch->tx_id.has_value()) {
      continue;
    }

    ++summary.queried;
    auto answer = chronicle::ledger::query_result{};
    try {
      answer = ctx.ledger.query(batch->tx_id.value());
    } catch (const std::exception& e) {
      answer.code = to_code(error_code::ledger_unavailable);
      answer.log = e.what();
    }
    if (answer.code != 0) {
      spdlog::warn("Ledger query for batch {} tx {} failed: {}", to_hex(root),
                   batch->tx_id.value(), answer.log);
      if (findings != nullptr) {
        findings->push_back(fsck_finding{.code = error_code::ledger_unavailable,
                                         .subject = root,
                                         .detail = answer.log});
      }
      continue;
    }
    if (!answer.confirmed) {
      ++summary.unconfirmed;
      continue;
    }

    auto marked =
        ctx.anchors.mark_confirmed(root, answer.height, answer.timestamp);
    if (marked.code != 0) {
      spdlog::error("Could not record confirmation of batch {}: {}",
                    to_hex(root), marked.log);
      if (findings != nullptr) {
        findings->push_back(
            fsck_finding{.code = static_cast<error_code>(marked.code),
                         .subject = root,
                         .detail = marked.log});
      }
      continue;
    }
    ++summary.confirmed;
    spdlog::info("Batch {} confirmed at height {}", to_hex(root),
                 answer.height);
  }
  return summary;
}

flush_engine::flush_engine(context& ctx) : context_{ctx} {}

flush_result_t flush_engine::flush() {
  auto result = flush_result_t{};
  result.codespace = std::string{kCodespace};

  auto lock = std::unique_lock{context_.flush_mutex, std::try_to_lock};
  if (!lock.owns_lock()) {
    spdlog::warn("Flush tick dropped, previous cycle still running in {}",
                 to_string(phase()));
    result.code = to_code(error_code::flush_in_progress);
    result.log = "flush already running";
    result.skipped = true;
    return result;
  }
  auto guard = phase_guard{phase_};
  auto now = context_.clock();

  resubmit(result);
  close_batch(now, result);

  phase_ = flush_phase_t::awaiting_confirmation;
  auto summary = poll_confirmations(context_, nullptr);
  result.confirmed = summary.confirmed;
  if (summary.code != error_code::ok) {
    record_failure(result, summary.code, "failed polling confirmations");
  }

  spdlog::info(
      "Flush finished: members {}, retried {}, submitted {}, failed {}, "
      "confirmed {}",
      result.members, result.retried, result.submitted, result.failed,
      result.confirmed);
  return result;
}

flush_phase_t flush_engine::phase() const {
  return phase_;
}

void flush_engine::resubmit(flush_result_t& result) {
  phase_ = flush_phase_t::submitting;
  auto roots = std::vector<root_t>{};
  auto code = context_.anchors.awaiting_submission(roots);
  if (code != error_code::ok) {
    record_failure(result, code, "failed listing batches awaiting submission");
    return;
  }
  for (const auto& root : roots) {
    auto batch = std::optional<batch_record_t>{};
    code = context_.anchors.get_batch(root, batch);
    if (code != error_code::ok || !batch.has_value()) {
      spdlog::error("Cannot read batch {} queued for submission", to_hex(root));
      continue;
    }
    if (batch->state == batch_state_t::failed) {
      auto retried = context_.anchors.mark_retry(root);
      if (retried.code != 0) {
        spdlog::error("Cannot requeue batch {}: {}", to_hex(root),
                      retried.log);
        continue;
      }
    }
    ++result.retried;
    spdlog::info("Resubmitting batch {} (attempt {})", to_hex(root),
                 batch->submit_attempts + 1);
    submit(root, result);
  }
}

void flush_engine::close_batch(const timestamp_seconds_t now,
                               flush_result_t& result) {
  phase_ = flush_phase_t::collecting;
  auto pending = std::vector<digest_record_t>{};
  auto code = context_.digests.pending_since(now, pending);
  if (code != error_code::ok) {
    record_failure(result, code, "failed reading pending digests");
    return;
  }
  if (pending.empty()) {
    spdlog::debug("No pending digests, no batch created");
    return;
  }

  phase_ = flush_phase_t::building;
  auto members = std::vector<digest_t>{};
  members.reserve(pending.size());
  for (const auto& record : pending) {
    members.push_back(record.digest);
  }

  auto writes = chronicle::storage::write_set{};
  auto created = context_.anchors.stage_batch(members, now, writes);
  if (created.code != 0) {
    record_failure(result, static_cast<error_code>(created.code), created.log);
    return;
  }
  code = context_.digests.stage_assignment(created.root, members, writes);
  if (code != error_code::ok) {
    record_failure(result, code, "failed staging digest assignment");
    return;
  }
  if (context_.storage.commit(writes) !=
      chronicle::storage::storage_status::ok) {
    record_failure(result, error_code::storage_unavailable,
                   "failed committing batch");
    return;
  }
  result.root = created.root;
  result.members = members.size();
  spdlog::info("Closed batch {} with {} digests", to_hex(created.root),
               members.size());

  phase_ = flush_phase_t::submitting;
  submit(created.root, result);
}

void flush_engine::submit(const root_t& root, flush_result_t& result) {
  auto submitted = chronicle::ledger::submit_result{};
  try {
    submitted = context_.ledger.submit(root);
  } catch (const std::exception& e) {
    submitted.code = to_code(error_code::ledger_unavailable);
    submitted.log = e.what();
  }
  if (submitted.code == 0 && submitted.tx_id.empty()) {
    submitted.code = to_code(error_code::ledger_unavailable);
    submitted.log = "ledger returned no transaction id";
  }

  if (submitted.code != 0) {
    spdlog::warn("Ledger submission of batch {} failed: {}", to_hex(root),
                 submitted.log);
    auto marked = context_.anchors.mark_failed(root, submitted.log);
    if (marked.code != 0) {
      spdlog::error("Cannot mark batch {} failed: {}", to_hex(root),
                    marked.log);
    }
    ++result.failed;
    return;
  }

  auto marked = context_.anchors.mark_submitted(root, submitted.tx_id);
  if (marked.code != 0) {
    spdlog::error("Batch {} broadcast as {} but not recorded: {}",
                  to_hex(root), submitted.tx_id, marked.log);
    record_failure(result, static_cast<error_code>(marked.code), marked.log);
    return;
  }
  ++result.submitted;
}

}  // namespace chronicle::anchor
