#include <spdlog/spdlog.h>
#include <altyn/blake3/hash.hpp>
#include <altyn/ledger/transaction_log.hpp>
#include <altyn/schema/key/ledger_keys.hpp>

using namespace altyn::schema;

namespace altyn::ledger {

hash32_t hash_transaction(encoder_t& encoder, transaction_t tx) {
  tx.hash = make_zero_hash();
  auto payload = encoder.encode(tx);
  return altyn::blake3::chain(tx.previous_hash, make_bytes_view(payload));
}

transaction_log::transaction_log(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void transaction_log::load() {
  auto key = key::make_log_head_key();
  head_ = storage_.get<encoder_t, log_head_t>(encoder_, make_bytes_view(key))
              .value_or(log_head_t{});
  spdlog::info("Transaction log at sequence {} (head {})", head_.sequence,
               to_hex(head_.hash));
}

log_head_t& transaction_log::staged_head(unit_of_work& work) {
  if (!work.head) {
    work.head = head_;
  }
  return *work.head;
}

const transaction_t& transaction_log::append(unit_of_work& work,
                                             transaction_t tx) {
  auto& head = staged_head(work);
  tx.id = make_identifier();
  tx.sequence = head.sequence + 1;
  tx.created_at = work.now;
  tx.previous_hash = head.hash;
  tx.hash = hash_transaction(encoder_, tx);
  head.sequence = tx.sequence;
  head.hash = tx.hash;
  work.transactions.push_back(std::move(tx));
  return work.transactions.back();
}

void transaction_log::record_receipt(unit_of_work& work, receipt_t receipt) {
  work.receipts.push_back(std::move(receipt));
}

const dividend_payout_t& transaction_log::record_payout(
    unit_of_work& work,
    dividend_payout_t payout) {
  auto& head = staged_head(work);
  head.payout_sequence += 1;
  payout.sequence = head.payout_sequence;
  payout.created_at = work.now;
  work.payouts.push_back(std::move(payout));
  return work.payouts.back();
}

std::optional<transaction_t> transaction_log::get(
    const std::string_view& transaction_id) const {
  auto key = key::make_transaction_id_key(transaction_id);
  auto sequence =
      storage_.get<encoder_t, uint64_t>(encoder_, make_bytes_view(key));
  if (!sequence) {
    return std::nullopt;
  }
  return at(*sequence);
}

std::optional<transaction_t> transaction_log::at(const uint64_t sequence) const {
  auto key = key::make_transaction_key(sequence);
  return storage_.get<encoder_t, transaction_t>(encoder_, make_bytes_view(key));
}

std::vector<transaction_t> transaction_log::by_account(
    const std::string_view& account_id,
    const std::size_t limit,
    const std::size_t offset) const {
  auto out = std::vector<transaction_t>{};
  auto prefix = key::make_account_transaction_prefix(account_id);
  for (const auto& [key, value] : storage_.list_by_prefix_reverse(
           make_bytes_view(prefix), limit, offset)) {
    auto tx = at(key::sequence_from_key(make_bytes_view(key)));
    if (!tx) {
      altyn::common::critical("account index points at a missing transaction");
    }
    out.push_back(std::move(*tx));
  }
  return out;
}

uint64_t transaction_log::count_for_account(
    const std::string_view& account_id) const {
  auto prefix = key::make_account_transaction_prefix(account_id);
  return storage_.count_by_prefix(make_bytes_view(prefix));
}

std::vector<transaction_t> transaction_log::recent(const transaction_type_t type,
                                                   const std::size_t limit) const {
  auto out = std::vector<transaction_t>{};
  auto prefix = key::make_type_transaction_prefix(type);
  for (const auto& [key, value] :
       storage_.list_by_prefix_reverse(make_bytes_view(prefix), limit, 0)) {
    auto tx = at(key::sequence_from_key(make_bytes_view(key)));
    if (!tx) {
      altyn::common::critical("type index points at a missing transaction");
    }
    out.push_back(std::move(*tx));
  }
  return out;
}

std::vector<dividend_payout_t> transaction_log::recent_payouts(
    const std::size_t limit) const {
  auto out = std::vector<dividend_payout_t>{};
  auto prefix = key::make_payout_prefix();
  for (const auto& [key, value] :
       storage_.list_by_prefix_reverse(make_bytes_view(prefix), limit, 0)) {
    out.push_back(encoder_.decode<dividend_payout_t>(make_bytes_view(value)));
  }
  return out;
}

std::optional<receipt_t> transaction_log::find_receipt(
    const std::string_view& receipt_id) const {
  auto key = key::make_receipt_key(receipt_id);
  return storage_.get<encoder_t, receipt_t>(encoder_, make_bytes_view(key));
}

const log_head_t& transaction_log::head() const {
  return head_;
}

void transaction_log::stage(const unit_of_work& work,
                            altyn::storage::write_batch& batch) {
  for (const auto& tx : work.transactions) {
    batch.puts.emplace_back(key::make_transaction_key(tx.sequence),
                            encoder_.encode(tx));
    batch.puts.emplace_back(key::make_transaction_id_key(tx.id),
                            encoder_.encode(tx.sequence));
    batch.puts.emplace_back(key::make_type_transaction_key(tx.type, tx.sequence),
                            bytes_t{});
    batch.puts.emplace_back(
        key::make_account_transaction_key(tx.to_account, tx.sequence),
        bytes_t{});
    if (tx.from_account && *tx.from_account != tx.to_account) {
      batch.puts.emplace_back(
          key::make_account_transaction_key(*tx.from_account, tx.sequence),
          bytes_t{});
    }
  }
  for (const auto& receipt : work.receipts) {
    batch.puts.emplace_back(key::make_receipt_key(receipt.receipt_id),
                            encoder_.encode(receipt));
  }
  for (const auto& payout : work.payouts) {
    batch.puts.emplace_back(key::make_payout_key(payout.sequence),
                            encoder_.encode(payout));
  }
  if (work.head) {
    batch.puts.emplace_back(key::make_log_head_key(),
                            encoder_.encode(*work.head));
  }
}

void transaction_log::apply(unit_of_work& work) {
  if (work.head) {
    head_ = *work.head;
  }
}

}  // namespace altyn::ledger
