#pragma once

#include <chronicle/schema/batch_record.hpp>
#include <chronicle/schema/create_batch_result.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/operation_result.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::store {

/// Durable record of batches keyed by aggregate root, with a secondary index
/// on submission state.
///
/// State moves are checked against `is_valid_transition` and applied under
/// one store-wide mutex so concurrent flush and fsck passes cannot interleave
/// a read-modify-write on the same batch.
class anchor_store final {
 public:
  explicit anchor_store(chronicle::storage::rocksdb_storage_t& storage);

  /// Compute the root of `members` and persist the batch as unsubmitted.
  /// Fails with `duplicate_root` when the root is already stored.
  chronicle::schema::create_batch_result_t create_batch(
      const std::vector<chronicle::schema::digest_t>& members,
      chronicle::schema::timestamp_seconds_t closed_at);

  /// Same checks as `create_batch`, staged into `writes` without committing.
  chronicle::schema::create_batch_result_t stage_batch(
      const std::vector<chronicle::schema::digest_t>& members,
      chronicle::schema::timestamp_seconds_t closed_at,
      chronicle::storage::write_set& writes) const;

  /// unsubmitted -> submitted. Also records the batch as the last anchor.
  chronicle::schema::operation_result_t mark_submitted(
      const chronicle::schema::root_t& root,
      const std::string& tx_id);

  /// submitted -> confirmed. Repeating an identical confirmation succeeds;
  /// a different one fails with `conflicting_confirmation`.
  chronicle::schema::operation_result_t mark_confirmed(
      const chronicle::schema::root_t& root,
      int64_t height,
      chronicle::schema::timestamp_seconds_t confirmed_at);

  /// unsubmitted | submitted | failed -> failed.
  chronicle::schema::operation_result_t mark_failed(
      const chronicle::schema::root_t& root,
      const std::string& reason);

  /// failed -> unsubmitted, clearing the stale transaction id.
  chronicle::schema::operation_result_t mark_retry(
      const chronicle::schema::root_t& root);

  /// Batches in submitted or failed state.
  chronicle::schema::error_code unconfirmed(
      std::vector<chronicle::schema::root_t>& roots) const;

  /// Unsubmitted and failed batches, oldest closure first.
  chronicle::schema::error_code awaiting_submission(
      std::vector<chronicle::schema::root_t>& roots) const;

  chronicle::schema::error_code get_batch(
      const chronicle::schema::root_t& root,
      std::optional<chronicle::schema::batch_record_t>& batch) const;

  chronicle::schema::error_code last_anchor(
      std::optional<chronicle::schema::batch_record_t>& batch) const;

  chronicle::schema::error_code list_all(
      std::vector<chronicle::schema::batch_record_t>& batches) const;

  /// Stage restored batches with their state index and last-anchor pointer.
  void stage_import(const std::vector<chronicle::schema::batch_record_t>& batches,
                    chronicle::storage::write_set& writes) const;

 private:
  using mutator_t = std::function<void(chronicle::schema::batch_record_t&)>;

  chronicle::schema::operation_result_t transition(
      const chronicle::schema::root_t& root,
      chronicle::schema::batch_state_t target,
      const mutator_t& mutate,
      bool record_last_anchor);

  // Caller holds `mutex_` and has read `existing` under it.
  chronicle::schema::operation_result_t apply_transition(
      const chronicle::schema::root_t& root,
      std::optional<chronicle::schema::batch_record_t>& existing,
      chronicle::schema::batch_state_t target,
      const mutator_t& mutate,
      bool record_last_anchor);

  chronicle::schema::error_code list_state(
      chronicle::schema::batch_state_t state,
      std::vector<chronicle::schema::root_t>& roots) const;

  mutable std::mutex mutex_;
  chronicle::storage::rocksdb_storage_t& storage_;
};

}  // namespace chronicle::store
