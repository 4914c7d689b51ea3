#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <chronicle/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace chronicle::storage {

namespace detail {

inline chronicle::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const chronicle::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  storage_status get(const chronicle::schema::bytes_view_t& key,
                     chronicle::schema::bytes_t& value) const;

  template <typename Encoder, typename T>
  storage_status get(Encoder& encoder,
                     const chronicle::schema::bytes_view_t& key,
                     T& decoded) const;

  storage_status list_by_prefix(const chronicle::schema::bytes_view_t& prefix,
                                std::vector<key_value_entry_t>& entries) const;
  storage_status commit(const write_set& writes) const;
  bool is_open() const;
  void close();
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline storage_status storage<rocksdb_storage_tag>::get(
    const chronicle::schema::bytes_view_t& key,
    chronicle::schema::bytes_t& value) const {
  if (!database) {
    spdlog::error("RocksDB database is not open");
    return storage_status::unavailable;
  }
  auto raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key), &raw);
  if (status.IsNotFound()) {
    return storage_status::not_found;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    return storage_status::unavailable;
  }
  value.assign(std::begin(raw), std::end(raw));
  return storage_status::ok;
}

template <typename Encoder, typename T>
storage_status storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const chronicle::schema::bytes_view_t& key,
    T& decoded) const {
  auto raw = chronicle::schema::bytes_t{};
  auto status = get(key, raw);
  if (status != storage_status::ok) {
    return status;
  }
  auto value = encoder.template try_decode<T>(
      chronicle::schema::bytes_view_t{raw.data(), raw.size()});
  if (!value.has_value()) {
    spdlog::warn("Failed decoding value stored at key of {} bytes",
                 key.size());
    return storage_status::not_found;
  }
  decoded = std::move(value.value());
  return storage_status::ok;
}

inline storage_status storage<rocksdb_storage_tag>::list_by_prefix(
    const chronicle::schema::bytes_view_t& prefix,
    std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    spdlog::error("RocksDB database is not open");
    return storage_status::unavailable;
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    return storage_status::unavailable;
  }
  return storage_status::ok;
}

inline storage_status storage<rocksdb_storage_tag>::commit(
    const write_set& writes) const {
  if (!database) {
    spdlog::error("RocksDB database is not open");
    return storage_status::unavailable;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : writes.deletes) {
    auto delete_status = batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      spdlog::error("Failed staging delete: {}", delete_status.ToString());
      return storage_status::unavailable;
    }
  }
  for (const auto& [key, value] : writes.puts) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      spdlog::error("Failed staging put: {}", put_status.ToString());
      return storage_status::unavailable;
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write set: {}", write_status.ToString());
    return storage_status::unavailable;
  }
  return storage_status::ok;
}

inline bool storage<rocksdb_storage_tag>::is_open() const {
  return static_cast<bool>(database);
}

inline void storage<rocksdb_storage_tag>::close() {
  if (database) {
    auto status = database->Close();
    if (!status.ok()) {
      spdlog::warn("RocksDB close reported: {}", status.ToString());
    }
    database.reset();
  }
}

}  // namespace chronicle::storage
