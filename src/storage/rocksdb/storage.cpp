#include <vigil/common/critical.hpp>
#include <vigil/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <string>
#include <system_error>

namespace vigil::storage {

namespace {

ROCKSDB_NAMESPACE::Options make_queue_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.IncreaseParallelism(1);
  options.OptimizeLevelStyleCompaction();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto directory = std::string{path};
  auto error = std::error_code{};
  auto existed = std::filesystem::exists(directory, error);

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(make_queue_options(), directory, &database);
  if (!status.ok()) {
    vigil::common::critical("cannot open queue store at {}: {}", directory,
                            status.ToString());
  }
  spdlog::info("{} queue store at {}", existed ? "Opened" : "Created",
               directory);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace vigil::storage
