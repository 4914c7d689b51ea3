#pragma once

#include <chronicle/ledger/ledger_client.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/store/anchor_store.hpp>
#include <chronicle/store/digest_store.hpp>
#include <chrono>
#include <functional>
#include <mutex>

namespace chronicle::anchor {

using clock_fn_t = std::function<chronicle::schema::timestamp_seconds_t()>;

chronicle::schema::timestamp_seconds_t system_clock_seconds();

/// Everything one flush cycle or reconciliation pass touches. Owned by the
/// backend and handed to each operation by reference.
struct context final {
  chronicle::storage::rocksdb_storage_t& storage;
  chronicle::store::digest_store& digests;
  chronicle::store::anchor_store& anchors;
  chronicle::ledger::ledger_client ledger;
  clock_fn_t clock;
  std::chrono::seconds flush_period{3600};
  /// Held for the whole flush cycle; shutdown acquires it before closing
  /// storage.
  std::mutex flush_mutex;
};

}  // namespace chronicle::anchor
