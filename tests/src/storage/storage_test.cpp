#include <altyn/schema/encoding/scale/encoder.hpp>
#include <altyn/schema/key/ledger_keys.hpp>
#include <altyn/schema/wallet_state.hpp>
#include <altyn/storage/rocksdb/storage.hpp>
#include <altyn/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace altyn::schema;

namespace {

using storage_t = altyn::storage::storage<altyn::storage::rocksdb_storage_tag>;
using encoder_t = altyn::schema::encoding::scale_encoder_t;

altyn::storage::write_batch make_batch(const std::string& prefix,
                                       const uint64_t first,
                                       const uint64_t count) {
  auto batch = altyn::storage::write_batch{};
  for (auto i = first; i < first + count; ++i) {
    auto key = make_bytes(std::string_view{prefix});
    auto suffix = key::make_transaction_key(i);
    key.insert(std::end(key), std::begin(suffix), std::end(suffix));
    batch.puts.emplace_back(std::move(key), make_bytes(std::to_string(i)));
  }
  return batch;
}

}  // namespace

TEST(storage, put_and_get_round_trip_records) {
  auto db = altyn::testing::make_db_path("altyn_storage_get");
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto wallet = wallet_state_t{};
    wallet.account_id = "alice";
    wallet.coin_balance = make_amount(100, 5);
    wallet.token_balance = make_amount(70);

    auto key = key::make_wallet_key("alice");
    storage.put(encoder, make_bytes_view(key), wallet);

    auto loaded = storage.get<encoder_t, wallet_state_t>(encoder,
                                                          make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->account_id, "alice");
    EXPECT_EQ(loaded->coin_balance, wallet.coin_balance);
    EXPECT_EQ(loaded->token_balance, wallet.token_balance);

    auto missing_key = key::make_wallet_key("bob");
    EXPECT_FALSE((storage.get<encoder_t, wallet_state_t>(
                      encoder, make_bytes_view(missing_key)))
                     .has_value());
  }
  altyn::testing::remove_path(db);
}

TEST(storage, batch_commits_every_entry) {
  auto db = altyn::testing::make_db_path("altyn_storage_batch");
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.write(make_batch("A|", 1, 5)));
    ASSERT_TRUE(storage.write(make_batch("B|", 1, 3)));

    auto prefix = make_bytes(std::string_view{"A|"});
    auto entries = storage.list_by_prefix(make_bytes_view(prefix));
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(make_string(entries.front().second), "1");
    EXPECT_EQ(make_string(entries.back().second), "5");
    EXPECT_EQ(storage.count_by_prefix(make_bytes_view(prefix)), 5u);
  }
  altyn::testing::remove_path(db);
}

TEST(storage, reverse_listing_pages_from_the_end) {
  auto db = altyn::testing::make_db_path("altyn_storage_reverse");
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.write(make_batch("A|", 1, 10)));
    ASSERT_TRUE(storage.write(make_batch("B|", 1, 2)));

    auto prefix = make_bytes(std::string_view{"A|"});
    auto first_page = storage.list_by_prefix_reverse(make_bytes_view(prefix), 3, 0);
    ASSERT_EQ(first_page.size(), 3u);
    EXPECT_EQ(make_string(first_page[0].second), "10");
    EXPECT_EQ(make_string(first_page[2].second), "8");

    auto last_page = storage.list_by_prefix_reverse(make_bytes_view(prefix), 5, 8);
    ASSERT_EQ(last_page.size(), 2u);
    EXPECT_EQ(make_string(last_page[0].second), "2");
    EXPECT_EQ(make_string(last_page[1].second), "1");

    EXPECT_TRUE(
        storage.list_by_prefix_reverse(make_bytes_view(prefix), 0, 0).empty());

    auto other = make_bytes(std::string_view{"B|"});
    auto tail = storage.list_by_prefix_reverse(make_bytes_view(other), 10, 0);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(make_string(tail[0].second), "2");
  }
  altyn::testing::remove_path(db);
}

TEST(storage, data_survives_reopen) {
  auto db = altyn::testing::make_db_path("altyn_storage_reopen");
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.write(make_batch("A|", 1, 2)));
  }
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(db);
    auto prefix = make_bytes(std::string_view{"A|"});
    EXPECT_EQ(storage.count_by_prefix(make_bytes_view(prefix)), 2u);
  }
  altyn::testing::remove_path(db);
}

TEST(storage, scan_stops_when_the_visitor_declines) {
  auto db = altyn::testing::make_db_path("altyn_storage_scan");
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.write(make_batch("A|", 1, 10)));
    ASSERT_TRUE(storage.write(make_batch("B|", 1, 3)));

    auto prefix = make_bytes(std::string_view{"A|"});
    auto seen = std::vector<std::string>{};
    storage.scan_prefix(make_bytes_view(prefix),
                        [&](const bytes_view_t&, const bytes_view_t& value) {
      seen.push_back(make_string(value));
      return seen.size() < 4;
    });
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen.front(), "1");
    EXPECT_EQ(seen.back(), "4");

    auto visited = std::size_t{0};
    auto other = make_bytes(std::string_view{"B|"});
    storage.scan_prefix(make_bytes_view(other),
                        [&](const bytes_view_t&, const bytes_view_t&) {
      ++visited;
      return true;
    });
    EXPECT_EQ(visited, 3u);
  }
  altyn::testing::remove_path(db);
}

TEST(storage, read_only_backend_rejects_batches) {
  auto db = altyn::testing::make_db_path("altyn_storage_read_only");
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.write(make_batch("A|", 1, 2)));
  }
  {
    auto storage =
        altyn::storage::make_storage<altyn::storage::rocksdb_storage_tag>(
            db, altyn::storage::open_mode::read_only);
    EXPECT_FALSE(storage.write(make_batch("A|", 3, 1)));
    auto prefix = make_bytes(std::string_view{"A|"});
    EXPECT_EQ(storage.count_by_prefix(make_bytes_view(prefix)), 2u);
  }
  altyn::testing::remove_path(db);
}
