#pragma once

#include <chronicle/schema/digest_record.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/put_result.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace chronicle::store {

/// Durable append-only record of submitted digests.
///
/// Each digest is pending until a flush assigns it to a batch. Pending digests
/// are indexed by submission sequence; every digest is also indexed by the
/// collection window it arrived in.
class digest_store final {
 public:
  /// Loads the next submission sequence; terminates if storage cannot be read.
  digest_store(chronicle::storage::rocksdb_storage_t& storage,
               std::chrono::seconds collection_period);

  /// Insert `digest` if absent. A digest that already exists, pending or
  /// batched, is reported with `already_existed` set and its current state.
  chronicle::schema::put_result_t put(
      const chronicle::schema::digest_t& digest,
      chronicle::schema::timestamp_seconds_t now);

  /// Every unbatched digest submitted at or before `cutoff`, in submission
  /// order, read from one storage snapshot.
  chronicle::schema::error_code pending_since(
      chronicle::schema::timestamp_seconds_t cutoff,
      std::vector<chronicle::schema::digest_record_t>& pending) const;

  /// Mark `digests` as members of `root` in one atomic write. The batch must
  /// already be stored.
  chronicle::schema::error_code assign_batch(
      const chronicle::schema::root_t& root,
      const std::vector<chronicle::schema::digest_t>& digests);

  /// Stage the assignment into `writes` without committing. Every digest must
  /// exist and be pending.
  chronicle::schema::error_code stage_assignment(
      const chronicle::schema::root_t& root,
      const std::vector<chronicle::schema::digest_t>& digests,
      chronicle::storage::write_set& writes) const;

  chronicle::schema::error_code lookup(
      const chronicle::schema::digest_t& digest,
      std::optional<chronicle::schema::digest_record_t>& record) const;

  /// Digests collected in the window starting at `collection`.
  chronicle::schema::error_code collection(
      chronicle::schema::timestamp_seconds_t collection,
      std::vector<chronicle::schema::digest_record_t>& records) const;

  /// Administrative removal. Only pending digests may be purged.
  chronicle::schema::error_code purge(const chronicle::schema::digest_t& digest);

  chronicle::schema::error_code list_all(
      std::vector<chronicle::schema::digest_record_t>& records) const;

  chronicle::schema::error_code count_pending(uint64_t& count) const;

  /// Stage rows and indices for restored records, plus the sequence counter.
  void stage_import(const std::vector<chronicle::schema::digest_record_t>& records,
                    chronicle::storage::write_set& writes) const;

  /// Re-read the sequence counter after an out-of-band import.
  chronicle::schema::error_code reload_sequence();

  chronicle::schema::timestamp_seconds_t collection_of(
      chronicle::schema::timestamp_seconds_t timestamp) const;

 private:
  void stage_record(const chronicle::schema::digest_record_t& record,
                    chronicle::storage::write_set& writes) const;

  mutable std::mutex mutex_;
  chronicle::storage::rocksdb_storage_t& storage_;
  int64_t collection_period_{};
  chronicle::schema::sequence_t next_sequence_{};
};

}  // namespace chronicle::store
