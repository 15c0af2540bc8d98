#include <cadence/common/critical.hpp>
#include <cadence/storage/rocksdb/storage.hpp>

namespace cadence::storage {

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
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    cadence::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    cadence::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    cadence::common::critical("failed to load committed state");
  }

  auto encoder = cadence::schema::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, cadence::schema::hash32_t>>(
          cadence::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    cadence::common::critical("failed to decode committed state");
  }
  return committed_state{.event_count = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const cadence::schema::bytes_view_t& prefix) const {
  if (!database) {
    cadence::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
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
    cadence::common::critical("failed listing keys by prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(const write_set& writes,
                                          const committed_state& state) const {
  if (!database) {
    cadence::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : writes.deletes) {
    auto delete_status = batch.Delete(
        detail::to_slice(cadence::schema::make_bytes_view(key)));
    if (!delete_status.ok()) {
      cadence::common::critical("failed staging delete in write batch");
    }
  }
  for (const auto& [key, value] : writes.puts) {
    auto put_status =
        batch.Put(detail::to_slice(cadence::schema::make_bytes_view(key)),
                  detail::to_slice(cadence::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      cadence::common::critical("failed staging put in write batch");
    }
  }

  auto encoder = cadence::schema::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.event_count, state.state_root});
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    cadence::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    cadence::common::critical("failed to commit write batch");
  }
  spdlog::debug("Committed {} put(s), {} delete(s), event_count={}",
                writes.puts.size(), writes.deletes.size(), state.event_count);
}

}  // namespace cadence::storage
