#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <stakeline/schema/encoding/scale/encoder.hpp>
#include <stakeline/storage/storage.hpp>
#include <memory>
#include <scale/scale.hpp>
#include <string>
#include <string_view>
#include <tuple>

namespace stakeline::storage {

namespace detail {

using encoder_t = stakeline::schema::encoding::scale_encoder_t;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|ENGINE|COMMITTED_STATE"};

inline stakeline::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const stakeline::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline std::string encode_committed_state(const committed_state& state) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  return std::string{reinterpret_cast<const char*>(encoded.data()),
                     encoded.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const stakeline::schema::bytes_view_t& prefix) const;
  void commit_by_prefix(const stakeline::schema::bytes_view_t& prefix,
                        const std::vector<key_value_entry_t>& entries,
                        const committed_state& state) const;

 private:
  void ensure_open() const;
  void stage_replacement(ROCKSDB_NAMESPACE::WriteBatch& batch,
                         const stakeline::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace stakeline::storage
