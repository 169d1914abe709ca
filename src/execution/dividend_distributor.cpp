#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <altyn/execution/dividend_distributor.hpp>
#include <altyn/schema/amount.hpp>
#include <algorithm>

using namespace altyn::schema;

namespace altyn::execution {

dividend_distributor::dividend_distributor(altyn::ledger::wallet_store& wallets,
                                           altyn::ledger::treasury& treasury,
                                           altyn::ledger::transaction_log& log,
                                           transfer_engine& transfers)
    : wallets_{wallets},
      treasury_{treasury},
      log_{log},
      transfers_{transfers} {}

amount_t dividend_distributor::pending_for(const amount_t& token_balance) const {
  const auto& state = treasury_.state();
  return pro_rata(state.collected_fees, token_balance,
                  state.total_token_supply, kCoinDecimals);
}

result<dividend_payout_t> dividend_distributor::distribute(
    altyn::ledger::unit_of_work& work,
    const identity_t& admin) {
  if (!admin.is_admin) {
    return make_error<dividend_payout_t>(
        ledger_error_code::unauthorized,
        fmt::format("{} may not distribute dividends", admin.user_id),
        kDividendCodespace);
  }

  auto pool = treasury_.staged_state(work).collected_fees;
  if (pool == 0) {
    return make_error<dividend_payout_t>(
        ledger_error_code::nothing_to_distribute, "fee pool is empty",
        kDividendCodespace);
  }
  auto holders = wallets_.token_holders();
  if (holders.empty()) {
    return make_error<dividend_payout_t>(
        ledger_error_code::nothing_to_distribute, "no token holders",
        kDividendCodespace);
  }

  auto supply = amount_t{};
  for (const auto& holder : holders) {
    supply += holder.token_balance;
  }

  // `holders` is in rank order here.
  auto shares = std::vector<dividend_share_t>{};
  shares.reserve(holders.size());
  auto allocated = amount_t{};
  for (const auto& holder : holders) {
    auto share = dividend_share_t{};
    share.account_id = holder.account_id;
    share.token_balance = holder.token_balance;
    share.token_percentage = percentage_of(holder.token_balance, supply);
    share.amount = pro_rata(pool, holder.token_balance, supply, kCoinDecimals);
    allocated += share.amount;
    shares.push_back(std::move(share));
  }

  if (allocated < pool) {
    shares.front().amount += pool - allocated;
  } else {
    auto excess = allocated - pool;
    for (auto& share : shares) {
      if (excess == 0) {
        break;
      }
      auto taken = std::min(excess, share.amount);
      share.amount -= taken;
      excess -= taken;
    }
  }

  std::ranges::sort(shares, [](const auto& lhs, const auto& rhs) {
    return lhs.account_id < rhs.account_id;
  });

  auto payout = dividend_payout_t{};
  payout.id = make_identifier();
  payout.total_distributed = pool;
  payout.holders_count = shares.size();

  for (const auto& share : shares) {
    if (share.amount == 0) {
      continue;
    }
    auto paid =
        transfers_.pay_dividend(work, share.account_id, share.amount, payout.id);
    if (!paid.ok()) {
      return forward_error<dividend_payout_t>(paid);
    }
  }
  if (auto code = treasury_.drain_fees(work, pool);
      code != ledger_error_code::ok) {
    return make_error<dividend_payout_t>(code, "fee pool changed mid-run",
                                         kDividendCodespace);
  }

  payout.distribution_details = std::move(shares);
  return make_result(log_.record_payout(work, std::move(payout)));
}

}  // namespace altyn::execution
