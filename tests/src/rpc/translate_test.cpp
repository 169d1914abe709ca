#include <altyn/rpc/translate.hpp>
#include <altyn/testing/common.hpp>
#include <gtest/gtest.h>

using namespace altyn::schema;
using altyn::testing::amount;

TEST(translate, transaction_amounts_use_display_format) {
  auto tx = transaction_t{};
  tx.id = "tx-1";
  tx.sequence = 3;
  tx.type = transaction_type_t::transfer;
  tx.asset = asset_type_t::coin;
  tx.from_account = "alice";
  tx.to_account = "bob";
  tx.amount = amount("50");
  tx.fee = amount("0.05");
  tx.net_amount = amount("49.95");
  tx.created_at = 1700000000123;

  auto message = altyn::ledger::v1::Transaction{};
  altyn::rpc::to_proto(tx, &message);
  EXPECT_EQ(message.id(), "tx-1");
  EXPECT_EQ(message.sequence(), 3u);
  EXPECT_EQ(message.type(), "TRANSFER");
  EXPECT_EQ(message.asset_type(), "COIN");
  EXPECT_EQ(message.from_account(), "alice");
  EXPECT_EQ(message.amount(), "50.00");
  EXPECT_EQ(message.fee(), "0.05");
  EXPECT_EQ(message.net_amount(), "49.95");
  EXPECT_EQ(message.created_at(), "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(message.reference(), "");
  EXPECT_EQ(message.hash().size(), 64u);
}

TEST(translate, emission_has_no_sender) {
  auto tx = transaction_t{};
  tx.type = transaction_type_t::emission;
  tx.to_account = "carol";
  tx.amount = amount("0.00000001");

  auto message = altyn::ledger::v1::Transaction{};
  altyn::rpc::to_proto(tx, &message);
  EXPECT_EQ(message.type(), "EMISSION");
  EXPECT_TRUE(message.from_account().empty());
  EXPECT_EQ(message.amount(), "0.00000001");
}

TEST(translate, wallet_figures) {
  auto view = wallet_view{};
  view.account_id = "alice";
  view.display_name = "Alice";
  view.coin_balance = amount("12.5");
  view.token_percentage = amount("33.3333");
  view.pending_dividends = amount("7");

  auto message = altyn::ledger::v1::Wallet{};
  altyn::rpc::to_proto(view, &message);
  EXPECT_EQ(message.coin_balance(), "12.50");
  EXPECT_EQ(message.token_balance(), "0.00");
  EXPECT_EQ(message.token_percentage(), "33.3333");
  EXPECT_EQ(message.pending_dividends(), "7.00");
}

TEST(translate, payout_details) {
  auto payout = dividend_payout_t{};
  payout.id = "payout-1";
  payout.sequence = 1;
  payout.total_distributed = amount("1000");
  payout.holders_count = 1;
  payout.distribution_details.push_back(dividend_share_t{
      .account_id = "alice",
      .token_balance = amount("70"),
      .token_percentage = amount("100"),
      .amount = amount("1000")});

  auto message = altyn::ledger::v1::DividendPayout{};
  altyn::rpc::to_proto(payout, &message);
  EXPECT_EQ(message.total_distributed(), "1000.00");
  ASSERT_EQ(message.distribution_details_size(), 1);
  EXPECT_EQ(message.distribution_details(0).account_id(), "alice");
  EXPECT_EQ(message.distribution_details(0).token_percentage(), "100.0000");
  EXPECT_EQ(message.distribution_details(0).amount(), "1000.00");
}

TEST(translate, status_is_copied_from_results) {
  auto failed = make_error<transaction_t>(ledger_error_code::insufficient_funds,
                                          "not enough", "altyn.transfer");
  auto response = altyn::ledger::v1::TransactionResponse{};
  altyn::rpc::set_status(failed, &response);
  EXPECT_EQ(response.code(),
            static_cast<uint32_t>(ledger_error_code::insufficient_funds));
  EXPECT_EQ(response.log(), "not enough");
  EXPECT_EQ(response.codespace(), "altyn.transfer");

  auto invalid = altyn::ledger::v1::TransactionResponse{};
  altyn::rpc::set_invalid_argument(ledger_error_code::invalid_amount,
                                   "bad amount", &invalid);
  EXPECT_EQ(invalid.codespace(), "altyn.rpc");
}

TEST(translate, amount_arguments) {
  EXPECT_EQ(altyn::rpc::parse_positive_amount("12.34"), amount("12.34"));
  EXPECT_FALSE(altyn::rpc::parse_positive_amount("0").has_value());
  EXPECT_FALSE(altyn::rpc::parse_positive_amount("").has_value());
  EXPECT_FALSE(altyn::rpc::parse_positive_amount("-1").has_value());
  EXPECT_FALSE(altyn::rpc::parse_positive_amount("1e3").has_value());

  EXPECT_EQ(altyn::rpc::parse_optional_amount(""), amount_t{});
  EXPECT_EQ(altyn::rpc::parse_optional_amount("5"), amount("5"));
  EXPECT_FALSE(altyn::rpc::parse_optional_amount("five").has_value());
}

TEST(translate, deadlines) {
  EXPECT_FALSE(altyn::rpc::make_deadline(0).has_value());
  auto before = std::chrono::steady_clock::now();
  auto deadline = altyn::rpc::make_deadline(250);
  ASSERT_TRUE(deadline.has_value());
  EXPECT_GE(*deadline, before + std::chrono::milliseconds{250});
}
