#include <chronicle/common/critical.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace chronicle::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto directory = std::filesystem::path{path};
  auto error = std::error_code{};
  std::filesystem::create_directories(directory, error);
  if (error) {
    chronicle::common::critical("Cannot create data directory {}: {}", path,
                                error.message());
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // Refuse to open over a corrupted table.
  options.paranoid_checks = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  auto store = storage<rocksdb_storage_tag>{};
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, directory.string(),
                                            &database);
  if (!status.ok()) {
    chronicle::common::critical("Failed to open anchor store at {}: {}", path,
                                status.ToString());
  }
  store.database.reset(database);
  spdlog::info("Opened anchor store at {}", path);
  return store;
}

}  // namespace chronicle::storage
