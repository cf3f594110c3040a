#include <spdlog/spdlog.h>
#include <stakeline/common/critical.hpp>
#include <stakeline/storage/rocksdb/storage.hpp>

namespace stakeline::storage {

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
    stakeline::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::ensure_open() const {
  if (!database) {
    stakeline::common::critical("RocksDB database is not initialized");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  ensure_open();
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{detail::kCommittedStateKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    stakeline::common::critical("failed to load committed state: {}",
                                status.ToString());
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, stakeline::schema::hash32_t>>(
          stakeline::schema::make_bytes_view(std::string_view{raw}));
  if (!decoded.has_value()) {
    stakeline::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const stakeline::schema::bytes_view_t& prefix) const {
  ensure_open();
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = stakeline::schema::make_string(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    stakeline::common::critical("failed iterating prefix: {}",
                                iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::stage_replacement(
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const stakeline::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  auto prefix_string = stakeline::schema::make_string(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(prefix_string)) {
      break;
    }
    if (!batch.Delete(iterator->key()).ok()) {
      stakeline::common::critical(
          "failed deleting key during prefix replacement");
    }
  }

  for (const auto& [key, value] : entries) {
    auto status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      stakeline::common::critical("failed writing key during prefix replacement");
    }
  }
}

void storage<rocksdb_storage_tag>::commit_by_prefix(
    const stakeline::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  ensure_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_replacement(batch, prefix, entries);
  auto status = batch.Put(std::string{detail::kCommittedStateKey},
                          detail::encode_committed_state(state));
  if (!status.ok()) {
    stakeline::common::critical("failed staging committed state");
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  status = database->Write(write_options, &batch);
  if (!status.ok()) {
    stakeline::common::critical("failed to commit state at height {}: {}",
                                state.height, status.ToString());
  }
}

}  // namespace stakeline::storage
