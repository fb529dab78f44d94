#include <guardrail/common/critical.hpp>
#include <guardrail/storage/rocksdb/storage.hpp>

#include <limits>

namespace guardrail::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    guardrail::common::critical("Failed to open RocksDB at " + std::string{path},
                                status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const guardrail::schema::bytes_view_t& prefix) const {
  return list_range(prefix, prefix, std::numeric_limits<std::size_t>::max());
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const guardrail::schema::bytes_view_t& prefix,
    const guardrail::schema::bytes_view_t& start,
    const std::size_t limit) const {
  if (!database) {
    guardrail::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(start));
  while (iterator->Valid() && entries.size() < limit) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    guardrail::common::critical("RocksDB iteration failed",
                                iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    guardrail::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      guardrail::common::critical("Failed staging key in write batch",
                                  put_status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    guardrail::common::critical("Failed to commit write batch",
                                write_status.ToString());
  }
}

}  // namespace guardrail::storage
