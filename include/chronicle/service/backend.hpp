#pragma once

#include <chronicle/anchor/context.hpp>
#include <chronicle/anchor/flush_engine.hpp>
#include <chronicle/anchor/reconciler.hpp>
#include <chronicle/anchor/scheduler.hpp>
#include <chronicle/ledger/ledger_client.hpp>
#include <chronicle/schema/collection_result.hpp>
#include <chronicle/schema/flush_result.hpp>
#include <chronicle/schema/fsck_report.hpp>
#include <chronicle/schema/last_anchor_result.hpp>
#include <chronicle/schema/lookup_result.hpp>
#include <chronicle/schema/operation_result.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/put_result.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/store/anchor_store.hpp>
#include <chronicle/store/digest_store.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <shared_mutex>
#include <string_view>

namespace chronicle::service {

struct backend_options final {
  std::chrono::seconds flush_period{3600};
  std::chrono::seconds flush_offset{10};
  uint32_t stuck_multiple{24};
  bool enable_collections{};
};

/// Timestamping backend: the submission surface used by a front door and the
/// administrative surface used by the operator tool.
///
/// The backend borrows `storage` and owns everything built on top of it. Any
/// operation after `close` reports `storage_unavailable`; `close` waits for
/// operations already in flight.
class backend final {
 public:
  backend(chronicle::storage::rocksdb_storage_t& storage,
          chronicle::ledger::ledger_client ledger,
          chronicle::anchor::clock_fn_t clock,
          backend_options options);

  backend(const backend&) = delete;
  backend& operator=(const backend&) = delete;

  chronicle::schema::put_result_t put(const chronicle::schema::digest_t& digest);

  /// Digest status plus an inclusion proof regenerated from the batch members.
  chronicle::schema::lookup_result_t lookup(
      const chronicle::schema::digest_t& digest) const;

  /// Digests collected in the window containing `timestamp`. Requires
  /// `enable_collections`.
  chronicle::schema::collection_result_t collection(
      chronicle::schema::timestamp_seconds_t timestamp) const;

  chronicle::schema::last_anchor_result_t last_anchor() const;

  chronicle::schema::flush_result_t flush();

  chronicle::schema::fsck_report_t fsck(
      const chronicle::schema::fsck_options& options);

  /// Export every digest and batch. The machine form is a single SCALE
  /// record; the human form is one line per row and cannot be restored.
  chronicle::schema::operation_result_t dump(std::ostream& out, bool human);

  /// Import a machine-form dump into an empty store, re-deriving every root
  /// and index, then re-validate locally.
  chronicle::schema::operation_result_t restore(std::istream& in,
                                                bool verbose,
                                                std::string_view target);

  chronicle::schema::operation_result_t purge(
      const chronicle::schema::digest_t& digest);

  /// Start periodic flushing.
  void start();

  /// Stop the scheduler, wait for a running flush, then close storage.
  void close();

  const backend_options& options() const;

 private:
  backend_options options_;
  chronicle::storage::rocksdb_storage_t& storage_;
  chronicle::store::digest_store digests_;
  chronicle::store::anchor_store anchors_;
  chronicle::anchor::context context_;
  chronicle::anchor::flush_engine engine_;
  chronicle::anchor::reconciler reconciler_;
  std::unique_ptr<chronicle::anchor::scheduler> scheduler_;
  mutable std::shared_mutex lifecycle_mutex_;
  std::atomic<bool> closed_{};
};

}  // namespace chronicle::service
