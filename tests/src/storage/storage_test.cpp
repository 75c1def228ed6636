#include <gtest/gtest.h>
#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/storage/rocksdb/storage.hpp>
#include <leasegate/testing/common.hpp>

namespace {

using encoder_t = leasegate::schema::encoding::scale_encoder_t;

leasegate::schema::bytes_t key(const std::string_view text) {
  return leasegate::schema::make_bytes(text);
}

}  // namespace

TEST(storage, fresh_store_has_no_committed_state) {
  auto path = leasegate::testing::scoped_db_path{"leasegate_storage_fresh"};
  auto storage =
      leasegate::storage::make_storage<leasegate::storage::rocksdb_storage_tag>(
          path.path());
  EXPECT_FALSE(storage.load_committed_state().has_value());
  EXPECT_FALSE(
      storage.get_raw(leasegate::schema::make_bytes_view(key("missing")))
          .has_value());
}

TEST(storage, commit_writes_values_and_checkpoint_together) {
  auto path = leasegate::testing::scoped_db_path{"leasegate_storage_commit"};
  {
    auto storage = leasegate::storage::make_storage<
        leasegate::storage::rocksdb_storage_tag>(path.path());
    auto writes = leasegate::storage::write_set_t{};
    writes.emplace(key("POLICY|a"), leasegate::schema::bytes_t{0x01});
    writes.emplace(key("POLICY|b"), leasegate::schema::bytes_t{0x02});
    storage.commit(writes, leasegate::storage::committed_state{
                               .height = 7,
                               .state_root = leasegate::testing::make_hash(3)});
  }

  auto reopened =
      leasegate::storage::make_storage<leasegate::storage::rocksdb_storage_tag>(
          path.path());
  auto committed = reopened.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 7);
  EXPECT_EQ(committed->state_root, leasegate::testing::make_hash(3));

  auto value =
      reopened.get_raw(leasegate::schema::make_bytes_view(key("POLICY|b")));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, leasegate::schema::bytes_t{0x02});
}

TEST(storage, later_commit_moves_checkpoint_and_keeps_earlier_writes) {
  auto path = leasegate::testing::scoped_db_path{"leasegate_storage_later"};
  auto storage =
      leasegate::storage::make_storage<leasegate::storage::rocksdb_storage_tag>(
          path.path());
  auto encoder = encoder_t{};

  auto first = leasegate::storage::write_set_t{};
  first.emplace(key("LEASE|1"), encoder.encode(uint64_t{1}));
  first.emplace(key("NONCE|1"), encoder.encode(uint64_t{3}));
  storage.commit(first, leasegate::storage::committed_state{
                            .height = 0,
                            .state_root = leasegate::schema::make_zero_hash()});
  auto genesis = storage.load_committed_state();
  ASSERT_TRUE(genesis.has_value());
  EXPECT_EQ(genesis->height, 0);

  auto second = leasegate::storage::write_set_t{};
  second.emplace(key("NONCE|1"), encoder.encode(uint64_t{4}));
  storage.commit(second, leasegate::storage::committed_state{
                             .height = 1,
                             .state_root = leasegate::testing::make_hash(9)});

  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 1);
  EXPECT_EQ(committed->state_root, leasegate::testing::make_hash(9));

  auto lease = storage.get_raw(leasegate::schema::make_bytes_view(key("LEASE|1")));
  ASSERT_TRUE(lease.has_value());
  EXPECT_EQ(encoder.decode<uint64_t>(leasegate::schema::make_bytes_view(*lease)),
            1u);
  auto nonce = storage.get_raw(leasegate::schema::make_bytes_view(key("NONCE|1")));
  ASSERT_TRUE(nonce.has_value());
  EXPECT_EQ(encoder.decode<uint64_t>(leasegate::schema::make_bytes_view(*nonce)),
            4u);
}
