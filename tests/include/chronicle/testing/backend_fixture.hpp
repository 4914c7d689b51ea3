#pragma once

#include <chronicle/service/backend.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/testing/common.hpp>
#include <chronicle/testing/scripted_ledger.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle::testing {

/// Chronicle epoch used by the tests: a period boundary for any period that
/// divides one day.
inline constexpr auto kTestEpoch = chronicle::schema::timestamp_seconds_t{1'700'006'400};

inline chronicle::service::backend_options make_test_options(
    const bool enable_collections = false) {
  return chronicle::service::backend_options{
      .flush_period = std::chrono::seconds{3600},
      .flush_offset = std::chrono::seconds{10},
      .stuck_multiple = 24,
      .enable_collections = enable_collections};
}

/// Backend over a temporary RocksDB directory, a manual clock and a scripted
/// ledger. `reopen` simulates a process restart on the same directory.
class backend_fixture final {
 public:
  explicit backend_fixture(
      const std::string_view db_prefix,
      const chronicle::service::backend_options options = make_test_options())
      : db_path_{make_db_path(db_prefix)},
        options_{options},
        clock_{kTestEpoch},
        storage_{chronicle::storage::make_storage<
            chronicle::storage::rocksdb_storage_tag>(db_path_)} {
    backend_.emplace(storage_, ledger_.client(), clock_.fn(), options_);
  }

  backend_fixture(const backend_fixture&) = delete;
  backend_fixture& operator=(const backend_fixture&) = delete;
  backend_fixture(backend_fixture&&) = delete;
  backend_fixture& operator=(backend_fixture&&) = delete;

  ~backend_fixture() {
    backend_.reset();
    storage_.close();
    remove_path(db_path_);
  }

  void reopen() {
    backend_.reset();
    storage_.close();
    storage_ = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db_path_);
    backend_.emplace(storage_, ledger_.client(), clock_.fn(), options_);
  }

  const std::string& db_path() const { return db_path_; }
  chronicle::service::backend& backend() { return backend_.value(); }
  chronicle::storage::rocksdb_storage_t& storage() { return storage_; }
  scripted_ledger& ledger() { return ledger_; }
  manual_clock& clock() { return clock_; }

 private:
  std::string db_path_;
  chronicle::service::backend_options options_;
  manual_clock clock_;
  scripted_ledger ledger_;
  chronicle::storage::rocksdb_storage_t storage_;
  std::optional<chronicle::service::backend> backend_;
};

/// Stores over a temporary RocksDB directory, without the flush machinery.
class store_fixture final {
 public:
  explicit store_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        storage_{chronicle::storage::make_storage<
            chronicle::storage::rocksdb_storage_tag>(db_path_)},
        digests_{storage_, std::chrono::seconds{3600}},
        anchors_{storage_} {}

  store_fixture(const store_fixture&) = delete;
  store_fixture& operator=(const store_fixture&) = delete;

  ~store_fixture() {
    storage_.close();
    remove_path(db_path_);
  }

  chronicle::storage::rocksdb_storage_t& storage() { return storage_; }
  chronicle::store::digest_store& digests() { return digests_; }
  chronicle::store::anchor_store& anchors() { return anchors_; }

 private:
  std::string db_path_;
  chronicle::storage::rocksdb_storage_t storage_;
  chronicle::store::digest_store digests_;
  chronicle::store::anchor_store anchors_;
};

}  // namespace chronicle::testing
