#include <altyn/schema/encoding/scale/encoder.hpp>
#include <altyn/testing/common.hpp>
#include <gtest/gtest.h>

using namespace altyn::schema;
using altyn::testing::amount;

namespace {

transaction_t make_transaction() {
  auto tx = transaction_t{};
  tx.id = "tx-1";
  tx.sequence = 7;
  tx.type = transaction_type_t::marketplace_purchase;
  tx.asset = asset_type_t::coin;
  tx.from_account = "alice";
  tx.to_account = "org:acme";
  tx.amount = amount("123.45678901");
  tx.fee = fee_for(tx.amount);
  tx.net_amount = tx.amount - tx.fee;
  tx.created_at = 1700000000000;
  tx.description = "Lamp";
  tx.reference = "listing-9";
  tx.previous_hash.fill(0x11);
  tx.hash.fill(0x22);
  return tx;
}

// version (2) + compact length (1) + "tx-1" (4) + sequence (8)
constexpr auto kTypeOffset = std::size_t{15};

}  // namespace

TEST(encoding, transaction_survives_round_trip) {
  auto encoder = altyn::schema::encoding::scale_encoder_t{};
  auto tx = make_transaction();
  auto decoded = encoder.decode<transaction_t>(encoder.encode(tx));

  EXPECT_EQ(decoded.id, tx.id);
  EXPECT_EQ(decoded.sequence, tx.sequence);
  EXPECT_EQ(decoded.type, tx.type);
  EXPECT_EQ(decoded.from_account, tx.from_account);
  EXPECT_EQ(decoded.to_account, tx.to_account);
  EXPECT_EQ(decoded.amount, tx.amount);
  EXPECT_EQ(decoded.fee, amount("0.12"));
  EXPECT_EQ(decoded.net_amount, tx.net_amount);
  EXPECT_EQ(decoded.created_at, tx.created_at);
  EXPECT_EQ(decoded.reference, tx.reference);
  EXPECT_EQ(decoded.previous_hash, tx.previous_hash);
  EXPECT_EQ(decoded.hash, tx.hash);
}

TEST(encoding, missing_sender_decodes_as_empty) {
  auto encoder = altyn::schema::encoding::scale_encoder_t{};
  auto tx = make_transaction();
  tx.type = transaction_type_t::emission;
  tx.from_account.reset();
  tx.reference.reset();
  auto decoded = encoder.decode<transaction_t>(encoder.encode(tx));
  EXPECT_FALSE(decoded.from_account.has_value());
  EXPECT_FALSE(decoded.reference.has_value());
}

TEST(encoding, unknown_enum_value_is_rejected) {
  auto encoder = altyn::schema::encoding::scale_encoder_t{};
  auto bytes = encoder.encode(make_transaction());
  ASSERT_GT(bytes.size(), kTypeOffset);
  ASSERT_EQ(bytes[kTypeOffset],
            static_cast<uint8_t>(transaction_type_t::marketplace_purchase));

  bytes[kTypeOffset] = 0x7F;
  EXPECT_FALSE(encoder.try_decode<transaction_t>(bytes).has_value());
}

TEST(encoding, truncated_bytes_are_rejected) {
  auto encoder = altyn::schema::encoding::scale_encoder_t{};
  auto bytes = encoder.encode(make_transaction());
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder.try_decode<transaction_t>(bytes).has_value());
}

TEST(encoding, amounts_keep_full_precision) {
  auto encoder = altyn::schema::encoding::scale_encoder_t{};
  auto wallet = wallet_state_t{};
  wallet.account_id = "whale";
  wallet.coin_balance = amount("99999999999999999999.00000001");
  wallet.token_balance = amount("0.00000001");
  auto decoded = encoder.decode<wallet_state_t>(encoder.encode(wallet));
  EXPECT_EQ(decoded.coin_balance, wallet.coin_balance);
  EXPECT_EQ(decoded.token_balance, wallet.token_balance);
}
