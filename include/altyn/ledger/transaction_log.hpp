#pragma once
#include <altyn/ledger/unit_of_work.hpp>
#include <altyn/schema/dividend_payout.hpp>
#include <altyn/schema/log_head.hpp>
#include <altyn/schema/receipt.hpp>
#include <altyn/schema/transaction.hpp>
#include <altyn/schema/transaction_type.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace altyn::ledger {

/// Chain hash of `tx`: BLAKE3 over the previous hash and the encoded
/// transaction with its own hash field zeroed.
altyn::schema::hash32_t hash_transaction(encoder_t& encoder,
                                         altyn::schema::transaction_t tx);

/// Append-only record of every balance-affecting event, plus the receipts
/// and dividend payouts that reference it.
///
/// Entries are numbered from 1 without gaps and linked by hash so any
/// rewrite of history is detectable by an audit.
class transaction_log final {
 public:
  transaction_log(encoder_t& encoder, storage_t& storage);

  void load();

  /// Assign id, sequence, timestamp and chain hash to `tx` and stage it.
  const altyn::schema::transaction_t& append(unit_of_work& work,
                                             altyn::schema::transaction_t tx);

  /// Stage a receipt for a settled payment.
  void record_receipt(unit_of_work& work, altyn::schema::receipt_t receipt);

  /// Number and stage a dividend payout summary.
  const altyn::schema::dividend_payout_t& record_payout(
      unit_of_work& work,
      altyn::schema::dividend_payout_t payout);

  std::optional<altyn::schema::transaction_t> get(
      const std::string_view& transaction_id) const;
  std::optional<altyn::schema::transaction_t> at(uint64_t sequence) const;

  /// Transactions touching `account_id`, newest first.
  std::vector<altyn::schema::transaction_t> by_account(
      const std::string_view& account_id,
      std::size_t limit,
      std::size_t offset) const;
  uint64_t count_for_account(const std::string_view& account_id) const;

  /// Latest `limit` transactions of one type, newest first.
  std::vector<altyn::schema::transaction_t> recent(
      altyn::schema::transaction_type_t type,
      std::size_t limit) const;

  std::vector<altyn::schema::dividend_payout_t> recent_payouts(
      std::size_t limit) const;

  std::optional<altyn::schema::receipt_t> find_receipt(
      const std::string_view& receipt_id) const;

  const altyn::schema::log_head_t& head() const;

  void stage(const unit_of_work& work, altyn::storage::write_batch& batch);
  void apply(unit_of_work& work);

 private:
  altyn::schema::log_head_t& staged_head(unit_of_work& work);

  encoder_t& encoder_;
  storage_t& storage_;
  altyn::schema::log_head_t head_;
};

}  // namespace altyn::ledger
