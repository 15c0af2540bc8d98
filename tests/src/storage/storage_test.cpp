#include <cadence/schema/encoding/scale/encoder.hpp>
#include <cadence/schema/key/vault_keys.hpp>
#include <cadence/storage/rocksdb/storage.hpp>
#include <cadence/storage/storage.hpp>
#include <cadence/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

using cadence::testing::make_db_path;
using cadence::testing::make_hash;
using cadence::testing::remove_path;

TEST(storage, defaults_are_empty) {
  auto committed = cadence::storage::committed_state{};
  EXPECT_EQ(committed.event_count, 0u);
  EXPECT_TRUE(cadence::schema::is_zero(committed.state_root));
  EXPECT_TRUE(cadence::storage::write_set{}.empty());
}

TEST(storage, commit_writes_rows_and_checkpoint_atomically) {
  auto db = make_db_path("cadence_storage_commit");
  {
    auto storage =
        cadence::storage::make_storage<cadence::storage::rocksdb_storage_tag>(
            db);
    auto encoder = cadence::schema::scale_encoder_t{};
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto writes = cadence::storage::write_set{};
    for (auto id : {uint64_t{2}, uint64_t{0}, uint64_t{1}}) {
      auto row = cadence::schema::transaction_state_t{};
      row.transaction_id = id;
      row.value = id * 10;
      writes.puts.emplace_back(cadence::schema::key::make_transaction_key(id),
                               encoder.encode(row));
    }
    storage.commit(writes, cadence::storage::committed_state{
                               .event_count = 3, .state_root = make_hash(9)});

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->event_count, 3u);
    EXPECT_EQ(loaded->state_root, make_hash(9));

    auto rows = storage.list_by_prefix(cadence::schema::make_bytes_view(
        cadence::schema::key::make_prefix(
            cadence::schema::key::kTransactionPrefix)));
    ASSERT_EQ(rows.size(), 3u);
    for (auto i = std::size_t{0}; i < rows.size(); ++i) {
      auto row = encoder.decode<cadence::schema::transaction_state_t>(
          cadence::schema::make_bytes_view(rows[i].second));
      EXPECT_EQ(row.transaction_id, i);
    }

    auto single = storage.get<cadence::schema::transaction_state_t>(
        encoder, cadence::schema::make_bytes_view(
                     cadence::schema::key::make_transaction_key(1)));
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->value, 10);
  }
  remove_path(db);
}

TEST(storage, commit_deletes_confirmation_rows) {
  auto db = make_db_path("cadence_storage_delete");
  {
    auto storage =
        cadence::storage::make_storage<cadence::storage::rocksdb_storage_tag>(
            db);
    auto encoder = cadence::schema::scale_encoder_t{};
    auto key = cadence::schema::key::make_confirmation_key(4, make_hash(1));
    auto row = cadence::schema::confirmation_state_t{
        .transaction_id = 4, .owner = make_hash(1), .confirmed_at = 5};
    storage.put(encoder, cadence::schema::make_bytes_view(key), row);
    ASSERT_TRUE(storage
                    .get<cadence::schema::confirmation_state_t>(
                        encoder, cadence::schema::make_bytes_view(key))
                    .has_value());

    auto writes = cadence::storage::write_set{};
    writes.deletes.push_back(key);
    storage.commit(writes, cadence::storage::committed_state{});

    EXPECT_FALSE(storage
                     .get<cadence::schema::confirmation_state_t>(
                         encoder, cadence::schema::make_bytes_view(key))
                     .has_value());
    EXPECT_TRUE(storage
                    .list_by_prefix(cadence::schema::make_bytes_view(
                        cadence::schema::key::make_prefix(
                            cadence::schema::key::kConfirmationPrefix)))
                    .empty());
  }
  remove_path(db);
}
