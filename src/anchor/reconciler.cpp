#include <spdlog/spdlog.h>
#include <chronicle/anchor/flush_engine.hpp>
#include <chronicle/anchor/reconciler.hpp>
#include <chronicle/merkle/tree.hpp>
#include <chronicle/schema/key/anchor_keys.hpp>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

using namespace chronicle::schema;

namespace {

constexpr auto kCodespace = std::string_view{"chronicle.fsck"};

void add_finding(fsck_report_t& report,
                 const error_code code,
                 const hash32_t& subject,
                 std::string detail) {
  spdlog::warn("fsck {}: {} {}", to_string(code), to_hex(subject), detail);
  report.findings.push_back(fsck_finding{
      .code = code, .subject = subject, .detail = std::move(detail)});
}

}  // namespace

namespace chronicle::anchor {

reconciler::reconciler(context& ctx) : context_{ctx} {}

fsck_report_t reconciler::run(const fsck_options& options) {
  auto report = fsck_report_t{};
  report.codespace = std::string{kCodespace};

  // Batch and digest listings must come from the same flush generation.
  auto lock = std::scoped_lock{context_.flush_mutex};

  auto batches = std::vector<batch_record_t>{};
  auto code = context_.anchors.list_all(batches);
  if (code != error_code::ok) {
    report.code = to_code(code);
    report.log = "failed listing batches";
    return report;
  }

  auto by_root = std::map<root_t, const batch_record_t*>{};
  for (const auto& batch : batches) {
    ++report.batches_checked;
    by_root.emplace(batch.root, &batch);
    if (options.verbose) {
      spdlog::info("batch {} state {} members {} closed {}",
                   to_hex(batch.root), to_string(batch.state),
                   batch.members.size(), batch.closed_at);
    }

    auto recomputed = chronicle::merkle::root(batch.members);
    if (!recomputed.has_value() || recomputed.value() != batch.root) {
      add_finding(report, error_code::corrupt_batch, batch.root,
                  "stored root does not match members");
    }
    auto distinct = std::set<digest_t>(std::begin(batch.members),
                                       std::end(batch.members));
    if (distinct.size() != batch.members.size()) {
      add_finding(report, error_code::corrupt_batch, batch.root,
                  "members repeat a digest");
    }

    auto index_key = chronicle::schema::key::make_batch_state_key(
        batch.state, batch.closed_at, batch.root);
    auto ignored = bytes_t{};
    if (context_.storage.get(bytes_view_t{index_key}, ignored) !=
        chronicle::storage::storage_status::ok) {
      add_finding(report, error_code::integrity_error, batch.root,
                  "missing state index entry");
    }

    for (const auto& member : batch.members) {
      if (options.print_hashes) {
        spdlog::info("  member {}", to_hex(member));
      }
      auto record = std::optional<digest_record_t>{};
      code = context_.digests.lookup(member, record);
      if (code != error_code::ok) {
        report.code = to_code(code);
        report.log = "failed reading batch member";
        return report;
      }
      if (!record.has_value()) {
        add_finding(report, error_code::integrity_error, member,
                    "member of " + to_hex(batch.root) + " has no digest row");
      } else if (record->batch != batch.root) {
        add_finding(report, error_code::integrity_error, member,
                    "member of " + to_hex(batch.root) +
                        " does not point back at it");
      }
    }
  }

  auto digests = std::vector<digest_record_t>{};
  code = context_.digests.list_all(digests);
  if (code != error_code::ok) {
    report.code = to_code(code);
    report.log = "failed listing digests";
    return report;
  }

  auto now = context_.clock();
  auto stuck_after =
      static_cast<int64_t>(options.stuck_multiple) * context_.flush_period.count();
  for (const auto& digest : digests) {
    ++report.digests_checked;
    if (digest.batch.has_value()) {
      auto found = by_root.find(digest.batch.value());
      if (found == std::end(by_root)) {
        add_finding(report, error_code::integrity_error, digest.digest,
                    "references missing batch " +
                        to_hex(digest.batch.value()));
      } else if (!chronicle::merkle::index_of(found->second->members,
                                              digest.digest)
                      .has_value()) {
        add_finding(report, error_code::integrity_error, digest.digest,
                    "not listed by its batch " +
                        to_hex(digest.batch.value()));
      }
      continue;
    }
    ++report.pending_digests;
    if (now - digest.submitted_at > stuck_after) {
      add_finding(report, error_code::stuck_digest, digest.digest,
                  "pending for " + std::to_string(now - digest.submitted_at) +
                      " seconds");
    }
  }

  if (options.query_ledger) {
    auto summary = poll_confirmations(context_, &report.findings);
    report.confirmations_advanced = summary.confirmed;
    if (summary.code != error_code::ok) {
      report.code = to_code(summary.code);
      report.log = "failed polling confirmations";
      return report;
    }
  }

  if (!report.findings.empty()) {
    report.code = to_code(report.findings.front().code);
    report.log = std::to_string(report.findings.size()) + " finding(s)";
  }
  spdlog::info(
      "fsck checked {} batches and {} digests ({} pending), advanced {} "
      "confirmations, {} findings",
      report.batches_checked, report.digests_checked, report.pending_digests,
      report.confirmations_advanced, report.findings.size());
  return report;
}

}  // namespace chronicle::anchor
