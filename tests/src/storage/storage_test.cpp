#include <gtest/gtest.h>
#include <stakeline/blake3/hash.hpp>
#include <stakeline/storage/rocksdb/storage.hpp>
#include <stakeline/testing/common.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace stakeline::schema;
using stakeline::testing::make_db_path;
using stakeline::testing::make_hash;
using stakeline::testing::remove_path;

namespace {

using storage_t = stakeline::storage::rocksdb_storage_t;
using stakeline::storage::key_value_entry_t;

key_value_entry_t row(const std::string_view key, const std::string_view value) {
  return {make_bytes(key), make_bytes(value)};
}

class storage_fixture final {
 public:
  explicit storage_fixture(const std::string_view prefix)
      : path_{make_db_path(prefix)},
        storage_{stakeline::storage::make_storage<
            stakeline::storage::rocksdb_storage_tag>(path_)} {}

  storage_fixture(const storage_fixture&) = delete;
  storage_fixture& operator=(const storage_fixture&) = delete;

  ~storage_fixture() {
    storage_.database.reset();
    remove_path(path_);
  }

  storage_t& storage() { return storage_; }

 private:
  std::string path_;
  storage_t storage_;
};

}  // namespace

TEST(storage, empty_database_has_no_committed_state) {
  auto fixture = storage_fixture{"stakeline_storage_empty"};
  EXPECT_FALSE(fixture.storage().load_committed_state().has_value());
}

TEST(storage, commit_by_prefix_replaces_rows_and_checkpoint) {
  auto fixture = storage_fixture{"stakeline_storage_commit"};
  auto prefix = make_bytes(std::string_view{"SYS|STATE|"});
  auto& storage = fixture.storage();

  storage.commit_by_prefix(
      make_bytes_view(prefix),
      {row("SYS|STATE|A", "1"), row("SYS|STATE|B", "2")},
      stakeline::storage::committed_state{.height = 1,
                                          .state_root = make_hash(0x01)});
  storage.commit_by_prefix(
      make_bytes_view(prefix), {row("SYS|STATE|B", "3"), row("SYS|STATE|C", "4")},
      stakeline::storage::committed_state{.height = 2,
                                          .state_root = make_hash(0x02)});

  auto rows = storage.list_by_prefix(make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0], row("SYS|STATE|B", "3"));
  EXPECT_EQ(rows[1], row("SYS|STATE|C", "4"));

  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 2);
  EXPECT_EQ(committed->state_root, make_hash(0x02));
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto fixture = storage_fixture{"stakeline_storage_prefix"};
  auto& storage = fixture.storage();
  auto state = make_bytes(std::string_view{"SYS|STATE|DEPOSIT|"});
  storage.commit_by_prefix(
      make_bytes_view(state), {row("SYS|STATE|DEPOSIT|1", "a")},
      stakeline::storage::committed_state{.height = 1,
                                          .state_root = make_hash(0x01)});
  auto other = make_bytes(std::string_view{"SYS|STATE|REQUEST|"});
  storage.commit_by_prefix(
      make_bytes_view(other), {row("SYS|STATE|REQUEST|1", "b")},
      stakeline::storage::committed_state{.height = 2,
                                          .state_root = make_hash(0x02)});

  auto rows = storage.list_by_prefix(make_bytes_view(state));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0], row("SYS|STATE|DEPOSIT|1", "a"));
}

TEST(blake3_hash, row_digest_depends_on_boundaries_and_order) {
  auto joined = std::vector<key_value_entry_t>{row("ab", "c")};
  auto split = std::vector<key_value_entry_t>{row("a", "bc")};
  EXPECT_NE(stakeline::blake3::hash_rows(joined),
            stakeline::blake3::hash_rows(split));

  auto forward = std::vector<key_value_entry_t>{row("a", "1"), row("b", "2")};
  auto reverse = std::vector<key_value_entry_t>{row("b", "2"), row("a", "1")};
  EXPECT_NE(stakeline::blake3::hash_rows(forward),
            stakeline::blake3::hash_rows(reverse));
  EXPECT_EQ(stakeline::blake3::hash_rows(forward),
            stakeline::blake3::hash_rows(forward));
}

TEST(blake3_hash, no_rows_is_the_empty_input_digest) {
  EXPECT_EQ(to_hex(stakeline::blake3::hash_rows({})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(storage, empty_commit_clears_prefix_and_keeps_checkpoint) {
  auto fixture = storage_fixture{"stakeline_storage_empty_commit"};
  auto& storage = fixture.storage();
  auto prefix = make_bytes(std::string_view{"SYS|STATE|"});
  storage.commit_by_prefix(
      make_bytes_view(prefix), {row("SYS|STATE|A", "1")},
      stakeline::storage::committed_state{.height = 4,
                                          .state_root = make_hash(0x04)});
  storage.commit_by_prefix(
      make_bytes_view(prefix), {},
      stakeline::storage::committed_state{.height = 5,
                                          .state_root = make_hash(0x05)});

  EXPECT_TRUE(storage.list_by_prefix(make_bytes_view(prefix)).empty());
  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 5);
  EXPECT_EQ(committed->state_root, make_hash(0x05));
}
