#pragma once
#include <altyn/schema/primitives.hpp>
#include <altyn/schema/transaction_type.hpp>
#include <cstdint>
#include <string_view>

// Keyspace layout of the ledger database.
namespace altyn::schema::key {

inline constexpr auto kWalletPrefix = std::string_view{"WALLET|"};
inline constexpr auto kTreasuryKey = std::string_view{"TREASURY"};
inline constexpr auto kTransactionPrefix = std::string_view{"TX|"};
inline constexpr auto kAccountTransactionPrefix = std::string_view{"UTX|"};
inline constexpr auto kTypeTransactionPrefix = std::string_view{"TTX|"};
inline constexpr auto kTransactionIdPrefix = std::string_view{"TXID|"};
inline constexpr auto kPayoutPrefix = std::string_view{"PAYOUT|"};
inline constexpr auto kReceiptPrefix = std::string_view{"RECEIPT|"};
inline constexpr auto kLogHeadKey = std::string_view{"SYS|LOG|HEAD"};

bytes_t make_wallet_key(const std::string_view& account_id);
bytes_t make_wallet_prefix();
bytes_t make_treasury_key();
bytes_t make_transaction_key(uint64_t sequence);
bytes_t make_transaction_prefix();
bytes_t make_account_transaction_key(const std::string_view& account_id,
                                     uint64_t sequence);
bytes_t make_account_transaction_prefix(const std::string_view& account_id);
bytes_t make_type_transaction_key(transaction_type_t type, uint64_t sequence);
bytes_t make_type_transaction_prefix(transaction_type_t type);
bytes_t make_transaction_id_key(const std::string_view& transaction_id);
bytes_t make_payout_key(uint64_t sequence);
bytes_t make_payout_prefix();
bytes_t make_receipt_key(const std::string_view& receipt_id);
bytes_t make_log_head_key();

/// Trailing big-endian sequence of a TX|, UTX| or PAYOUT| key.
uint64_t sequence_from_key(const bytes_view_t& key);

}  // namespace altyn::schema::key
