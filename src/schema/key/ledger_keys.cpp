#include <altyn/common/critical.hpp>
#include <altyn/schema/key/builder.hpp>
#include <altyn/schema/key/ledger_keys.hpp>

namespace altyn::schema::key {

bytes_t make_wallet_key(const std::string_view& account_id) {
  return builder{}.write(kWalletPrefix).write(account_id).data;
}

bytes_t make_wallet_prefix() {
  return builder{}.write(kWalletPrefix).data;
}

bytes_t make_treasury_key() {
  return builder{}.write(kTreasuryKey).data;
}

bytes_t make_transaction_key(const uint64_t sequence) {
  return builder{}.write(kTransactionPrefix).write(sequence).data;
}

bytes_t make_transaction_prefix() {
  return builder{}.write(kTransactionPrefix).data;
}

bytes_t make_account_transaction_key(const std::string_view& account_id,
                                     const uint64_t sequence) {
  return builder{}
      .write(kAccountTransactionPrefix)
      .write_sized(account_id)
      .write(sequence)
      .data;
}

bytes_t make_account_transaction_prefix(const std::string_view& account_id) {
  return builder{}.write(kAccountTransactionPrefix).write_sized(account_id).data;
}

bytes_t make_type_transaction_key(const transaction_type_t type,
                                  const uint64_t sequence) {
  return builder{}
      .write(kTypeTransactionPrefix)
      .write(static_cast<uint8_t>(type))
      .write(sequence)
      .data;
}

bytes_t make_type_transaction_prefix(const transaction_type_t type) {
  return builder{}
      .write(kTypeTransactionPrefix)
      .write(static_cast<uint8_t>(type))
      .data;
}

bytes_t make_transaction_id_key(const std::string_view& transaction_id) {
  return builder{}.write(kTransactionIdPrefix).write(transaction_id).data;
}

bytes_t make_payout_key(const uint64_t sequence) {
  return builder{}.write(kPayoutPrefix).write(sequence).data;
}

bytes_t make_payout_prefix() {
  return builder{}.write(kPayoutPrefix).data;
}

bytes_t make_receipt_key(const std::string_view& receipt_id) {
  return builder{}.write(kReceiptPrefix).write(receipt_id).data;
}

bytes_t make_log_head_key() {
  return builder{}.write(kLogHeadKey).data;
}

uint64_t sequence_from_key(const bytes_view_t& key) {
  if (key.size() < sizeof(uint64_t)) {
    altyn::common::critical("ledger key too short to carry a sequence");
  }
  auto sequence = uint64_t{};
  for (auto byte : key.last(sizeof(uint64_t))) {
    sequence = (sequence << 8u) | byte;
  }
  return sequence;
}

}  // namespace altyn::schema::key
