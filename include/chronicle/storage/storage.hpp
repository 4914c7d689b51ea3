#pragma once
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace chronicle::storage {

using key_value_entry_t =
    std::pair<chronicle::schema::bytes_t, chronicle::schema::bytes_t>;

enum class storage_status : uint8_t { ok = 0, not_found = 1, unavailable = 2 };

/// Set of mutations applied as one atomic unit by `storage::commit`.
/// Deletes are applied before puts.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<chronicle::schema::bytes_t> deletes;

  void put(chronicle::schema::bytes_t key, chronicle::schema::bytes_t value) {
    puts.emplace_back(std::move(key), std::move(value));
  }

  void erase(chronicle::schema::bytes_t key) {
    deletes.push_back(std::move(key));
  }

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Read raw bytes at key.
  storage_status get(const chronicle::schema::bytes_view_t& key,
                     chronicle::schema::bytes_t& value) const;

  /// Read and decode value at key. A value that fails to decode is reported
  /// as `not_found` with `decoded` left untouched.
  template <typename Encoder, typename T>
  storage_status get(Encoder& encoder,
                     const chronicle::schema::bytes_view_t& key,
                     T& decoded) const;

  /// Return all key-value pairs that share the provided key prefix, read from
  /// one consistent iterator snapshot.
  storage_status list_by_prefix(const chronicle::schema::bytes_view_t& prefix,
                                std::vector<key_value_entry_t>& entries) const;

  /// Apply every mutation in `writes` atomically and durably.
  storage_status commit(const write_set& writes) const;

  bool is_open() const;
  void close();
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace chronicle::storage
