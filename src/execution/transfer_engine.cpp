#include <fmt/format.h>
#include <altyn/execution/transfer_engine.hpp>
#include <altyn/schema/amount.hpp>

using namespace altyn::schema;

namespace altyn::execution {

transfer_engine::transfer_engine(altyn::ledger::wallet_store& wallets,
                                 altyn::ledger::treasury& treasury,
                                 altyn::ledger::transaction_log& log)
    : wallets_{wallets}, treasury_{treasury}, log_{log} {}

result<transaction_t> transfer_engine::transfer(
    altyn::ledger::unit_of_work& work,
    const transfer_request& request) {
  if (request.amount == 0) {
    return make_error<transaction_t>(ledger_error_code::invalid_amount,
                                     "amount must be positive",
                                     kTransferCodespace);
  }
  if (request.from_account == request.to_account) {
    return make_error<transaction_t>(
        ledger_error_code::self_transfer_not_allowed,
        "sender and recipient are the same account", kTransferCodespace);
  }
  if (!is_fee_bearing(request.type)) {
    return make_error<transaction_t>(
        ledger_error_code::invalid_payment_type,
        fmt::format("{} is not a transfer type", to_string(request.type)),
        kTransferCodespace);
  }

  auto fee =
      request.asset == asset_type_t::coin ? fee_for(request.amount) : amount_t{};
  auto net_amount = request.amount - fee;

  if (auto code = wallets_.debit(work, request.from_account, request.asset,
                                 request.amount);
      code != ledger_error_code::ok) {
    return make_error<transaction_t>(
        code,
        fmt::format("cannot debit {} {} from {}: balance {}",
                    format_amount(request.amount), to_string(request.asset),
                    request.from_account,
                    format_amount(wallets_.staged_balance(
                        work, request.from_account, request.asset))),
        kTransferCodespace);
  }
  if (auto code =
          wallets_.credit(work, request.to_account, request.asset, net_amount);
      code != ledger_error_code::ok) {
    return make_error<transaction_t>(code, "net amount rounds to zero",
                                     kTransferCodespace);
  }
  treasury_.credit_fees(work, fee);

  auto tx = transaction_t{};
  tx.type = request.type;
  tx.asset = request.asset;
  tx.from_account = request.from_account;
  tx.to_account = request.to_account;
  tx.amount = request.amount;
  tx.fee = fee;
  tx.net_amount = net_amount;
  tx.description = request.description;
  tx.reference = request.reference;
  return make_result(log_.append(work, std::move(tx)));
}

result<transaction_t> transfer_engine::pay_dividend(
    altyn::ledger::unit_of_work& work,
    const account_id_t& account_id,
    const amount_t& amount,
    const std::string& payout_id) {
  if (auto code =
          wallets_.credit(work, account_id, asset_type_t::coin, amount);
      code != ledger_error_code::ok) {
    return make_error<transaction_t>(code, "dividend amount must be positive",
                                     kTransferCodespace);
  }
  wallets_.record_dividend(work, account_id, amount);

  auto tx = transaction_t{};
  tx.type = transaction_type_t::dividend;
  tx.asset = asset_type_t::coin;
  tx.to_account = account_id;
  tx.amount = amount;
  tx.net_amount = amount;
  tx.description = "Dividend payout";
  tx.reference = payout_id;
  return make_result(log_.append(work, std::move(tx)));
}

}  // namespace altyn::execution
