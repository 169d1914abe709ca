#include <altyn/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace altyn::schema;
using altyn::testing::amount;

TEST(settlement, purchase_issues_a_receipt) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_settlement_purchase"};
  ledger.fund("bob", "100");

  auto result = ledger.engine().pay(
      "bob", "carol", amount("20"), transaction_type_t::marketplace_purchase,
      std::optional<std::string>{"listing-42"}, "");
  ASSERT_TRUE(result.ok()) << result.log;
  const auto& tx = result.value->transaction;
  const auto& receipt = result.value->receipt;

  EXPECT_EQ(tx.type, transaction_type_t::marketplace_purchase);
  EXPECT_EQ(tx.fee, amount("0.02"));
  EXPECT_EQ(tx.description, "Marketplace purchase");
  EXPECT_EQ(tx.reference, std::optional<std::string>{"listing-42"});

  EXPECT_FALSE(receipt.receipt_id.empty());
  EXPECT_EQ(receipt.transaction_id, tx.id);
  EXPECT_EQ(receipt.date, tx.created_at);
  EXPECT_EQ(receipt.buyer_id, "bob");
  EXPECT_EQ(receipt.buyer_name, "Bob");
  EXPECT_EQ(receipt.seller_id, "carol");
  EXPECT_EQ(receipt.seller_name, "Carol");
  EXPECT_EQ(receipt.listing_id, std::optional<std::string>{"listing-42"});
  EXPECT_EQ(receipt.total_paid, amount("20"));
  EXPECT_EQ(receipt.fee_amount, amount("0.02"));
  EXPECT_EQ(receipt.status, receipt_status_t::completed);

  EXPECT_EQ(ledger.coin("bob"), amount("80"));
  EXPECT_EQ(ledger.coin("carol"), amount("19.98"));

  auto stored = ledger.engine().get_receipt(receipt.receipt_id);
  ASSERT_TRUE(stored.ok()) << stored.log;
  EXPECT_EQ(stored.value->transaction_id, tx.id);
  EXPECT_EQ(stored.value->total_paid, amount("20"));

  auto logged = ledger.engine().get_transaction(tx.id);
  ASSERT_TRUE(logged.ok()) << logged.log;
  EXPECT_EQ(logged.value->hash, tx.hash);
}

TEST(settlement, service_payment_to_an_organization) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_settlement_service"};
  ledger.fund("carol", "50");

  auto result = ledger.engine().pay("carol", "org:acme", amount("30"),
                                    transaction_type_t::service_payment,
                                    std::nullopt, "consulting");
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.value->transaction.description, "consulting");
  EXPECT_EQ(result.value->receipt.seller_name, "acme");
  EXPECT_FALSE(result.value->receipt.listing_id.has_value());
  EXPECT_EQ(ledger.coin("org:acme"), amount("29.97"));
}

TEST(settlement, failed_payment_leaves_no_receipt) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_settlement_failed"};
  ledger.fund("bob", "5");

  auto result = ledger.engine().pay(
      "bob", "carol", amount("20"), transaction_type_t::marketplace_purchase,
      std::optional<std::string>{"listing-7"}, "");
  EXPECT_EQ(result.code, ledger_error_code::insufficient_funds);
  EXPECT_NE(result.log.find("(listing listing-7)"), std::string::npos)
      << result.log;
  EXPECT_FALSE(result.value.has_value());
  EXPECT_EQ(ledger.coin("bob"), amount("5"));

  auto history = ledger.engine().get_transactions("carol", 10);
  ASSERT_TRUE(history.ok());
  EXPECT_EQ(history.value->total, 0u);
}

TEST(settlement, only_payment_types_settle) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_settlement_type"};
  ledger.fund("bob", "100");

  for (auto type : {transaction_type_t::transfer, transaction_type_t::emission,
                    transaction_type_t::dividend}) {
    auto result = ledger.engine().pay("bob", "carol", amount("1"), type,
                                      std::nullopt, "");
    EXPECT_EQ(result.code, ledger_error_code::invalid_payment_type)
        << to_string(type);
    EXPECT_EQ(result.codespace, "altyn.settlement");
  }
  EXPECT_EQ(ledger.coin("bob"), amount("100"));
}

TEST(settlement, unknown_receipt_is_not_found) {
  auto ledger = altyn::testing::ledger_fixture{"altyn_settlement_lookup"};
  EXPECT_EQ(ledger.engine().get_receipt("missing").code,
            ledger_error_code::not_found);
  EXPECT_EQ(ledger.engine().get_transaction("missing").code,
            ledger_error_code::not_found);
}
