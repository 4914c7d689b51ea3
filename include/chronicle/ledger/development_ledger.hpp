#pragma once

#include <chronicle/ledger/ledger_client.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace chronicle::ledger {

inline constexpr std::string_view kDevelopmentLedgerKeyPrefix{"DEVLEDGER|TX|"};

/// In-process ledger used by the daemon when no wallet client is configured.
///
/// Every submission is appended at the next height and reported confirmed
/// once `confirm_after` seconds have passed on the supplied clock.
/// Transactions are kept in `storage` beside the anchor keyspaces, so a
/// restarted daemon still confirms batches it submitted earlier.
class development_ledger final {
 public:
  using clock_fn_t = std::function<chronicle::schema::timestamp_seconds_t()>;

  /// Loads the next height; terminates if storage cannot be read.
  development_ledger(chronicle::storage::rocksdb_storage_t& storage,
                     clock_fn_t clock,
                     int64_t confirm_after);

  submit_result submit(const chronicle::schema::root_t& root);
  query_result query(const std::string& tx_id) const;

  /// Callbacks bound to this instance. The ledger must outlive them.
  ledger_client client();

 private:
  mutable std::mutex mutex_;
  chronicle::storage::rocksdb_storage_t& storage_;
  clock_fn_t clock_;
  int64_t confirm_after_{};
  int64_t next_height_{1};
};

}  // namespace chronicle::ledger
