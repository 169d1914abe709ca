#include <altyn/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

using namespace altyn::schema;
using altyn::testing::amount;

TEST(views, wallet_of_a_new_user_is_empty) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_empty"};
  auto wallet = ledger.engine().get_wallet("carol");
  ASSERT_TRUE(wallet.ok()) << wallet.log;
  EXPECT_EQ(wallet.value->account_id, "carol");
  EXPECT_EQ(wallet.value->display_name, "Carol");
  EXPECT_EQ(wallet.value->coin_balance, amount_t{});
  EXPECT_EQ(wallet.value->token_balance, amount_t{});
  EXPECT_EQ(wallet.value->token_percentage, amount_t{});
  EXPECT_EQ(wallet.value->pending_dividends, amount_t{});

  EXPECT_EQ(ledger.engine().get_wallet("nobody").code,
            ledger_error_code::not_found);
}

TEST(views, balances_are_visible_right_after_commit) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_fresh"};
  ledger.fund("alice", "100");
  ASSERT_TRUE(ledger.engine()
                  .transfer("alice", "bob", asset_type_t::coin, amount("50"),
                            "")
                  .ok());
  auto wallet = ledger.engine().get_wallet("bob");
  ASSERT_TRUE(wallet.ok());
  EXPECT_EQ(wallet.value->coin_balance, amount("49.95"));
}

TEST(views, portfolio_values_coin_in_every_currency) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_portfolio"};
  ledger.fund("carol", "10");
  ledger.grant_tokens("carol", "25");
  ledger.grant_tokens("bob", "75");

  auto portfolio = ledger.engine().get_portfolio("carol");
  ASSERT_TRUE(portfolio.ok()) << portfolio.log;
  EXPECT_EQ(portfolio.value->coin_balance, amount("10"));
  EXPECT_EQ(portfolio.value->token_balance, amount("25"));
  EXPECT_EQ(portfolio.value->token_percentage, amount("25"));

  const auto& valuations = portfolio.value->coin_valuations;
  ASSERT_EQ(valuations.size(), 4u);
  EXPECT_EQ(valuations[0].currency, "USD");
  EXPECT_EQ(valuations[0].value, amount("10"));
  EXPECT_EQ(valuations[1].currency, "EUR");
  EXPECT_EQ(valuations[1].value, amount("9.2"));
  EXPECT_EQ(valuations[2].currency, "KZT");
  EXPECT_EQ(valuations[2].value, amount("4500"));
  EXPECT_EQ(valuations[3].currency, "RUB");
  EXPECT_EQ(valuations[3].value, amount("900"));
  EXPECT_EQ(portfolio.value->rates.size(), 4u);
}

TEST(views, history_names_both_parties) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_history"};
  ledger.fund("alice", "100");
  ASSERT_TRUE(ledger.engine()
                  .transfer("alice", "bob", asset_type_t::coin, amount("10"),
                            "lunch")
                  .ok());
  ASSERT_TRUE(ledger.engine()
                  .transfer("bob", "alice", asset_type_t::coin, amount("5"),
                            "change")
                  .ok());

  auto history = ledger.engine().get_transactions("alice", 10);
  ASSERT_TRUE(history.ok()) << history.log;
  EXPECT_EQ(history.value->total, 3u);
  const auto& entries = history.value->entries;
  ASSERT_EQ(entries.size(), 3u);

  EXPECT_EQ(entries[0].transaction.description, "change");
  EXPECT_EQ(entries[0].from_name, "Bob");
  EXPECT_EQ(entries[0].to_name, "Alice");
  EXPECT_TRUE(entries[0].is_incoming);

  EXPECT_EQ(entries[1].transaction.description, "lunch");
  EXPECT_FALSE(entries[1].is_incoming);

  EXPECT_EQ(entries[2].transaction.type, transaction_type_t::emission);
  EXPECT_EQ(entries[2].from_name, "Treasury");
  EXPECT_TRUE(entries[2].is_incoming);

  auto page = ledger.engine().get_transactions("alice", 1, 1);
  ASSERT_TRUE(page.ok());
  ASSERT_EQ(page.value->entries.size(), 1u);
  EXPECT_EQ(page.value->entries[0].transaction.description, "lunch");
  EXPECT_EQ(page.value->total, 3u);
}

TEST(views, history_page_is_capped) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_cap"};
  for (auto i = 0; i < 105; ++i) {
    ledger.fund("alice", "1");
  }
  auto history = ledger.engine().get_transactions("alice", 1000);
  ASSERT_TRUE(history.ok());
  EXPECT_EQ(history.value->total, 105u);
  EXPECT_EQ(history.value->entries.size(), altyn::execution::kMaxHistoryPage);
}

TEST(views, token_holders_are_ranked_with_percentages) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_holders"};
  ledger.grant_tokens("carol", "20");
  ledger.grant_tokens("alice", "50");
  ledger.grant_tokens("bob", "30");
  ledger.fund("dave", "5");

  auto all = ledger.engine().get_token_holders(0);
  EXPECT_EQ(all.holders_count, 3u);
  EXPECT_EQ(all.total_supply, amount("100"));
  ASSERT_EQ(all.holders.size(), 3u);
  EXPECT_EQ(all.holders[0].account_id, "alice");
  EXPECT_EQ(all.holders[0].display_name, "Alice");
  EXPECT_EQ(all.holders[0].percentage, amount("50"));
  EXPECT_EQ(all.holders[1].account_id, "bob");
  EXPECT_EQ(all.holders[2].account_id, "carol");

  auto top = ledger.engine().get_token_holders(2);
  EXPECT_EQ(top.holders_count, 3u);
  ASSERT_EQ(top.holders.size(), 2u);
  EXPECT_EQ(top.holders[1].account_id, "bob");
}

TEST(views, token_percentage_uses_four_decimals) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_percentage"};
  ledger.grant_tokens("alice", "1");
  ledger.grant_tokens("bob", "2");

  auto wallet = ledger.engine().get_wallet("alice");
  ASSERT_TRUE(wallet.ok());
  EXPECT_EQ(wallet.value->token_percentage, amount("33.3333"));
}

TEST(views, corporate_wallet_needs_an_operator) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_corporate"};
  ledger.fund("org:acme", "12.5");

  auto wallet = ledger.engine().get_corporate_wallet("alice", "acme");
  ASSERT_TRUE(wallet.ok()) << wallet.log;
  EXPECT_EQ(wallet.value->account_id, "org:acme");
  EXPECT_EQ(wallet.value->display_name, "acme");
  EXPECT_EQ(wallet.value->coin_balance, amount("12.5"));

  EXPECT_EQ(ledger.engine().get_corporate_wallet("bob", "acme").code,
            ledger_error_code::unauthorized);
  EXPECT_EQ(ledger.engine().get_corporate_wallet("alice", "globex").code,
            ledger_error_code::unauthorized);
  EXPECT_EQ(ledger.engine().get_corporate_wallet("nobody", "acme").code,
            ledger_error_code::not_found);
}

TEST(views, treasury_stats_are_admin_only) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_treasury"};
  ledger.fund("alice", "100");

  auto stats = ledger.engine().get_treasury_stats("admin");
  ASSERT_TRUE(stats.ok()) << stats.log;
  EXPECT_EQ(stats.value->treasury.total_coins_in_circulation, amount("100"));
  EXPECT_EQ(ledger.engine().get_treasury_stats("alice").code,
            ledger_error_code::unauthorized);
  EXPECT_EQ(ledger.engine().audit("alice").code,
            ledger_error_code::unauthorized);
}

TEST(views, repeated_reads_agree) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_repeat"};
  ledger.fund("alice", "100");
  ledger.grant_tokens("alice", "4");
  ASSERT_TRUE(ledger.engine()
                  .transfer("alice", "bob", asset_type_t::coin, amount("25"),
                            "")
                  .ok());

  auto first = ledger.engine().get_wallet("alice");
  auto second = ledger.engine().get_wallet("alice");
  ASSERT_TRUE(first.ok()) << first.log;
  ASSERT_TRUE(second.ok()) << second.log;
  EXPECT_EQ(first.value->account_id, second.value->account_id);
  EXPECT_EQ(first.value->display_name, second.value->display_name);
  EXPECT_EQ(first.value->coin_balance, amount("75"));
  EXPECT_EQ(first.value->coin_balance, second.value->coin_balance);
  EXPECT_EQ(first.value->token_balance, second.value->token_balance);
  EXPECT_EQ(first.value->token_percentage, second.value->token_percentage);
  EXPECT_EQ(first.value->pending_dividends, second.value->pending_dividends);
  EXPECT_EQ(first.value->dividends_received, second.value->dividends_received);

  EXPECT_EQ(ledger.engine().get_balance("bob", asset_type_t::coin),
            ledger.engine().get_balance("bob", asset_type_t::coin));
  EXPECT_EQ(ledger.engine().get_balance("bob", asset_type_t::coin),
            amount("24.97"));
  EXPECT_EQ(ledger.engine().get_transactions("alice", 10).value->total,
            ledger.engine().get_transactions("alice", 10).value->total);
}

TEST(views, identity_resolver_may_read_the_ledger) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_views_reentrant"};
  ledger.fund("alice", "100");

  auto directory = altyn::testing::make_directory().resolver();
  auto lookups = std::size_t{0};
  ledger.engine().set_identity_resolver(
      [&](const std::string_view& user_id) {
        ++lookups;
        ledger.engine().get_balance(user_id, asset_type_t::coin);
        return directory(user_id);
      });

  auto sent = ledger.engine().transfer("alice", "bob", asset_type_t::coin,
                                       amount("10"), "");
  ASSERT_TRUE(sent.ok()) << sent.log;
  auto history = ledger.engine().get_transactions("bob", 10);
  ASSERT_TRUE(history.ok()) << history.log;
  ASSERT_EQ(history.value->entries.size(), 1u);
  EXPECT_EQ(history.value->entries[0].from_name, "Alice");
  EXPECT_EQ(ledger.engine().get_token_holders(0).holders_count, 0u);
  EXPECT_TRUE(ledger.engine().get_wallet("bob").ok());
  EXPECT_GT(lookups, 0u);
}
