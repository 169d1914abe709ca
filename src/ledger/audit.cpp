#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <altyn/ledger/audit.hpp>
#include <altyn/ledger/transaction_log.hpp>
#include <altyn/schema/amount.hpp>
#include <altyn/schema/key/ledger_keys.hpp>
#include <map>
#include <string>

using namespace altyn::schema;

namespace {

struct replayed_wallet final {
  amount_t coin{};
  amount_t token{};
  amount_t dividends{};
};

struct replay_state final {
  std::map<account_id_t, replayed_wallet> wallets;
  treasury_state_t treasury;
};

amount_t& balance_of(replayed_wallet& wallet, const asset_type_t asset) {
  return asset == asset_type_t::coin ? wallet.coin : wallet.token;
}

audit_report fail(audit_report report, std::string error) {
  spdlog::warn("Ledger audit failed: {}", error);
  report.ok = false;
  report.error = std::move(error);
  return report;
}

// Returns an error message, or an empty string when the entry replays.
std::string replay(replay_state& state, const transaction_t& tx) {
  switch (tx.type) {
    case transaction_type_t::emission:
      if (tx.from_account || tx.fee != 0 || tx.net_amount != tx.amount) {
        return "malformed emission";
      }
      balance_of(state.wallets[tx.to_account], tx.asset) += tx.amount;
      if (tx.asset == asset_type_t::coin) {
        state.treasury.total_coins_in_circulation += tx.amount;
      } else {
        state.treasury.total_token_supply += tx.amount;
      }
      return {};
    case transaction_type_t::dividend:
      if (tx.from_account || tx.asset != asset_type_t::coin || tx.fee != 0 ||
          tx.net_amount != tx.amount) {
        return "malformed dividend";
      }
      if (state.treasury.collected_fees < tx.amount) {
        return "dividend exceeds fee pool";
      }
      state.treasury.collected_fees -= tx.amount;
      state.treasury.lifetime_dividends += tx.amount;
      state.wallets[tx.to_account].coin += tx.amount;
      state.wallets[tx.to_account].dividends += tx.amount;
      return {};
    case transaction_type_t::transfer:
    case transaction_type_t::marketplace_purchase:
    case transaction_type_t::service_payment: {
      if (!tx.from_account || tx.fee + tx.net_amount != tx.amount) {
        return "malformed transfer";
      }
      auto expected_fee = tx.asset == asset_type_t::coin ? fee_for(tx.amount)
                                                         : amount_t{};
      if (tx.fee != expected_fee) {
        return "fee does not match the fee rate";
      }
      auto& from = balance_of(state.wallets[*tx.from_account], tx.asset);
      if (from < tx.amount) {
        return "transfer overdraws the sender";
      }
      from -= tx.amount;
      balance_of(state.wallets[tx.to_account], tx.asset) += tx.net_amount;
      state.treasury.collected_fees += tx.fee;
      state.treasury.lifetime_fees += tx.fee;
      return {};
    }
  }
  return "unknown transaction type";
}

}  // namespace

namespace altyn::ledger {

audit_report audit_ledger(encoder_t& encoder, const storage_t& storage) {
  auto report = audit_report{};
  auto state = replay_state{};

  auto previous_hash = make_zero_hash();
  auto expected_sequence = uint64_t{1};
  auto error = std::string{};
  auto tx_prefix = key::make_transaction_prefix();
  storage.scan_prefix(make_bytes_view(tx_prefix),
                      [&](const bytes_view_t& entry_key,
                          const bytes_view_t& value) {
    auto tx = encoder.try_decode<transaction_t>(value);
    if (!tx) {
      error = fmt::format("undecodable transaction at sequence {}",
                          expected_sequence);
      return false;
    }
    if (tx->sequence != expected_sequence ||
        key::sequence_from_key(entry_key) != expected_sequence) {
      error = fmt::format("sequence gap at {}", expected_sequence);
      return false;
    }
    if (tx->previous_hash != previous_hash) {
      error = fmt::format("broken hash link at sequence {}", tx->sequence);
      return false;
    }
    if (hash_transaction(encoder, *tx) != tx->hash) {
      error = fmt::format("hash mismatch at sequence {}", tx->sequence);
      return false;
    }
    if (auto replay_error = replay(state, *tx); !replay_error.empty()) {
      error = fmt::format("{} at sequence {}", replay_error, tx->sequence);
      return false;
    }
    previous_hash = tx->hash;
    ++expected_sequence;
    ++report.transactions;
    return true;
  });
  if (!error.empty()) {
    return fail(report, std::move(error));
  }

  auto head_key = key::make_log_head_key();
  auto head = storage.get<encoder_t, log_head_t>(encoder,
                                                 make_bytes_view(head_key))
                  .value_or(log_head_t{});
  if (head.sequence != report.transactions || head.hash != previous_hash) {
    return fail(report, "log head does not match the last transaction");
  }

  auto coin_total = amount_t{};
  auto token_total = amount_t{};
  auto wallet_prefix = key::make_wallet_prefix();
  storage.scan_prefix(make_bytes_view(wallet_prefix),
                      [&](const bytes_view_t&, const bytes_view_t& value) {
    auto wallet = encoder.try_decode<wallet_state_t>(value);
    if (!wallet) {
      error = "undecodable wallet record";
      return false;
    }
    auto replayed = state.wallets[wallet->account_id];
    if (replayed.coin != wallet->coin_balance ||
        replayed.token != wallet->token_balance ||
        replayed.dividends != wallet->dividends_received) {
      error = fmt::format("wallet {} does not match its history",
                          wallet->account_id);
      return false;
    }
    coin_total += wallet->coin_balance;
    token_total += wallet->token_balance;
    ++report.wallets;
    return true;
  });
  if (!error.empty()) {
    return fail(report, std::move(error));
  }
  if (report.wallets != state.wallets.size()) {
    return fail(report, "log references wallets that are not stored");
  }

  auto treasury_key = key::make_treasury_key();
  auto treasury =
      storage.get<encoder_t, treasury_state_t>(encoder,
                                                make_bytes_view(treasury_key))
          .value_or(treasury_state_t{});
  if (treasury.collected_fees != state.treasury.collected_fees ||
      treasury.total_coins_in_circulation !=
          state.treasury.total_coins_in_circulation ||
      treasury.total_token_supply != state.treasury.total_token_supply ||
      treasury.lifetime_fees != state.treasury.lifetime_fees ||
      treasury.lifetime_dividends != state.treasury.lifetime_dividends) {
    return fail(report, "treasury does not match the log");
  }
  if (coin_total + treasury.collected_fees !=
      treasury.total_coins_in_circulation) {
    return fail(report, "COIN conservation violated");
  }
  if (token_total != treasury.total_token_supply) {
    return fail(report, "TOKEN supply does not match holdings");
  }

  report.ok = true;
  spdlog::info("Ledger audit passed: {} transaction(s), {} wallet(s)",
               report.transactions, report.wallets);
  return report;
}

}  // namespace altyn::ledger
