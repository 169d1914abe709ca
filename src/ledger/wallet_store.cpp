#include <spdlog/spdlog.h>
#include <altyn/ledger/wallet_store.hpp>
#include <altyn/schema/key/ledger_keys.hpp>
#include <algorithm>
#include <iterator>

using namespace altyn::schema;

namespace {

amount_t& balance_of(wallet_state_t& wallet, const asset_type_t asset) {
  return asset == asset_type_t::coin ? wallet.coin_balance
                                     : wallet.token_balance;
}

const amount_t& balance_of(const wallet_state_t& wallet,
                           const asset_type_t asset) {
  return asset == asset_type_t::coin ? wallet.coin_balance
                                     : wallet.token_balance;
}

}  // namespace

namespace altyn::ledger {

wallet_store::wallet_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void wallet_store::load() {
  wallets_.clear();
  auto prefix = key::make_wallet_prefix();
  storage_.scan_prefix(make_bytes_view(prefix),
                       [&](const bytes_view_t&, const bytes_view_t& value) {
    auto wallet = encoder_.decode<wallet_state_t>(value);
    auto account_id = wallet.account_id;
    wallets_.insert_or_assign(std::move(account_id), std::move(wallet));
    return true;
  });
  spdlog::info("Loaded {} wallet(s)", wallets_.size());
}

amount_t wallet_store::get_balance(const std::string_view& account_id,
                                   const asset_type_t asset) const {
  auto it = wallets_.find(account_id);
  if (it == std::end(wallets_)) {
    return {};
  }
  return balance_of(it->second, asset);
}

std::optional<wallet_state_t> wallet_store::find(
    const std::string_view& account_id) const {
  auto it = wallets_.find(account_id);
  if (it == std::end(wallets_)) {
    return std::nullopt;
  }
  return it->second;
}

amount_t wallet_store::staged_balance(const unit_of_work& work,
                                      const std::string_view& account_id,
                                      const asset_type_t asset) const {
  auto it = work.wallets.find(account_id_t{account_id});
  if (it != std::end(work.wallets)) {
    return balance_of(it->second, asset);
  }
  return get_balance(account_id, asset);
}

wallet_state_t& wallet_store::staged(unit_of_work& work,
                                     const std::string_view& account_id) {
  auto key = account_id_t{account_id};
  auto it = work.wallets.find(key);
  if (it != std::end(work.wallets)) {
    return it->second;
  }
  auto wallet = wallet_state_t{};
  if (auto committed = wallets_.find(account_id);
      committed != std::end(wallets_)) {
    wallet = committed->second;
  } else {
    wallet.account_id = key;
    wallet.created_at = work.now;
  }
  return work.wallets.emplace(std::move(key), std::move(wallet)).first->second;
}

ledger_error_code wallet_store::credit(unit_of_work& work,
                                       const std::string_view& account_id,
                                       const asset_type_t asset,
                                       const amount_t& amount) {
  if (amount == 0) {
    return ledger_error_code::invalid_amount;
  }
  auto& wallet = staged(work, account_id);
  balance_of(wallet, asset) += amount;
  wallet.updated_at = work.now;
  return ledger_error_code::ok;
}

ledger_error_code wallet_store::debit(unit_of_work& work,
                                      const std::string_view& account_id,
                                      const asset_type_t asset,
                                      const amount_t& amount) {
  if (amount == 0) {
    return ledger_error_code::invalid_amount;
  }
  if (staged_balance(work, account_id, asset) < amount) {
    return ledger_error_code::insufficient_funds;
  }
  auto& wallet = staged(work, account_id);
  balance_of(wallet, asset) -= amount;
  wallet.updated_at = work.now;
  return ledger_error_code::ok;
}

void wallet_store::record_dividend(unit_of_work& work,
                                   const std::string_view& account_id,
                                   const amount_t& amount) {
  auto& wallet = staged(work, account_id);
  wallet.dividends_received += amount;
  wallet.updated_at = work.now;
}

std::vector<wallet_state_t> wallet_store::token_holders() const {
  auto holders = std::vector<wallet_state_t>{};
  for (const auto& [account_id, wallet] : wallets_) {
    if (wallet.token_balance > 0) {
      holders.push_back(wallet);
    }
  }
  std::ranges::stable_sort(holders, [](const auto& lhs, const auto& rhs) {
    return lhs.token_balance > rhs.token_balance;
  });
  return holders;
}

std::size_t wallet_store::size() const {
  return wallets_.size();
}

void wallet_store::stage(const unit_of_work& work,
                         altyn::storage::write_batch& batch) {
  for (const auto& [account_id, wallet] : work.wallets) {
    batch.puts.emplace_back(key::make_wallet_key(account_id),
                            encoder_.encode(wallet));
  }
}

void wallet_store::apply(unit_of_work& work) {
  for (auto& [account_id, wallet] : work.wallets) {
    wallets_.insert_or_assign(account_id, std::move(wallet));
  }
}

}  // namespace altyn::ledger
