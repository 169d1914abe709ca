#include <altyn/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

using namespace altyn::schema;
using altyn::testing::amount;

TEST(emission, admin_mints_coin) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_mint"};

  auto result = ledger.engine().emit("admin", "carol", amount("250.5"), "");
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.value->type, transaction_type_t::emission);
  EXPECT_FALSE(result.value->from_account.has_value());
  EXPECT_EQ(result.value->fee, amount_t{});
  EXPECT_EQ(result.value->net_amount, amount("250.5"));
  EXPECT_EQ(result.value->description, "Coin emission");

  EXPECT_EQ(ledger.coin("carol"), amount("250.5"));
  EXPECT_EQ(ledger.treasury().total_coins_in_circulation, amount("250.5"));
  EXPECT_EQ(ledger.treasury().collected_fees, amount_t{});
}

TEST(emission, non_admin_is_unauthorized) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_denied"};
  ledger.fund("bob", "5");

  auto result = ledger.engine().emit("alice", "alice", amount("10000"), "");
  EXPECT_EQ(result.code, ledger_error_code::unauthorized);
  EXPECT_EQ(result.codespace, "altyn.emission");
  EXPECT_EQ(ledger.coin("alice"), amount_t{});
  EXPECT_EQ(ledger.treasury().total_coins_in_circulation, amount("5"));
}

TEST(emission, non_admin_learns_nothing_about_targets) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_target_hidden"};

  auto emitted = ledger.engine().emit("carol", "nobody", amount("1"), "");
  EXPECT_EQ(emitted.code, ledger_error_code::unauthorized);
  EXPECT_EQ(emitted.codespace, "altyn.emission");

  auto known = ledger.engine().emit("carol", "bob", amount("1"), "");
  EXPECT_EQ(known.code, ledger_error_code::unauthorized);
  EXPECT_EQ(known.log, emitted.log);

  auto issued = ledger.engine().issue_tokens("carol", "nobody", amount("1"),
                                             amount("1"));
  EXPECT_EQ(issued.code, ledger_error_code::unauthorized);
  EXPECT_EQ(issued.codespace, "altyn.emission");
  EXPECT_EQ(ledger.treasury().total_coins_in_circulation, amount_t{});
}

TEST(emission, zero_amount_is_invalid) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_zero"};
  auto result = ledger.engine().emit("admin", "bob", amount_t{}, "");
  EXPECT_EQ(result.code, ledger_error_code::invalid_amount);
}

TEST(emission, unknown_target_is_not_found) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_unknown"};
  auto result = ledger.engine().emit("admin", "nobody", amount("1"), "");
  EXPECT_EQ(result.code, ledger_error_code::not_found);
  EXPECT_EQ(ledger.treasury().total_coins_in_circulation, amount_t{});
}

TEST(emission, issue_tokens_mints_both_assets) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_issue"};

  auto result = ledger.engine().issue_tokens("admin", "carol", amount("100"),
                                             amount("40"));
  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_EQ(result.value->size(), 2u);
  EXPECT_EQ(result.value->at(0).asset, asset_type_t::token);
  EXPECT_EQ(result.value->at(1).asset, asset_type_t::coin);
  EXPECT_EQ(result.value->at(1).sequence, result.value->at(0).sequence + 1);

  EXPECT_EQ(ledger.engine().get_balance("carol", asset_type_t::token),
            amount("100"));
  EXPECT_EQ(ledger.coin("carol"), amount("40"));
  auto treasury = ledger.treasury();
  EXPECT_EQ(treasury.total_token_supply, amount("100"));
  EXPECT_EQ(treasury.total_coins_in_circulation, amount("40"));
}

TEST(emission, issue_tokens_skips_zero_legs) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_partial"};

  auto tokens_only = ledger.engine().issue_tokens("admin", "bob", amount("7"),
                                                  amount_t{});
  ASSERT_TRUE(tokens_only.ok()) << tokens_only.log;
  ASSERT_EQ(tokens_only.value->size(), 1u);
  EXPECT_EQ(tokens_only.value->front().asset, asset_type_t::token);

  auto nothing = ledger.engine().issue_tokens("admin", "bob", amount_t{},
                                              amount_t{});
  EXPECT_EQ(nothing.code, ledger_error_code::invalid_amount);

  auto denied = ledger.engine().issue_tokens("bob", "bob", amount("1"),
                                             amount_t{});
  EXPECT_EQ(denied.code, ledger_error_code::unauthorized);
  EXPECT_EQ(ledger.treasury().total_token_supply, amount("7"));
}

TEST(emission, treasury_stats_list_recent_emissions) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_emission_stats"};
  ledger.fund("alice", "1");
  ledger.fund("bob", "2");

  auto stats = ledger.engine().get_treasury_stats("admin");
  ASSERT_TRUE(stats.ok()) << stats.log;
  ASSERT_EQ(stats.value->recent_emissions.size(), 2u);
  EXPECT_EQ(stats.value->recent_emissions[0].to_account, "bob");
  EXPECT_EQ(stats.value->recent_emissions[1].to_account, "alice");

  EXPECT_EQ(ledger.engine().get_treasury_stats("bob").code,
            ledger_error_code::unauthorized);
}
