#pragma once
#include <stakeline/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace stakeline::storage {

using key_value_entry_t =
    std::pair<stakeline::schema::bytes_t, stakeline::schema::bytes_t>;

/// Last checkpoint written by engine::commit.
struct committed_state final {
  int64_t height{};
  stakeline::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const stakeline::schema::bytes_view_t& prefix) const;

  /// Replace every entry under prefix with the provided entries and store
  /// the checkpoint, in a single atomic write.
  void commit_by_prefix(const stakeline::schema::bytes_view_t& prefix,
                        const std::vector<key_value_entry_t>& entries,
                        const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace stakeline::storage
