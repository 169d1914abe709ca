#include <fmt/format.h>
#include <altyn/execution/emission_service.hpp>
#include <altyn/schema/amount.hpp>

using namespace altyn::schema;

namespace altyn::execution {

emission_service::emission_service(altyn::ledger::wallet_store& wallets,
                                   altyn::ledger::treasury& treasury,
                                   altyn::ledger::transaction_log& log)
    : wallets_{wallets}, treasury_{treasury}, log_{log} {}

const transaction_t& emission_service::mint(altyn::ledger::unit_of_work& work,
                                            const asset_type_t asset,
                                            const account_id_t& target,
                                            const amount_t& amount,
                                            const std::string& description) {
  if (wallets_.credit(work, target, asset, amount) != ledger_error_code::ok) {
    altyn::common::critical("credit of a validated mint amount was rejected");
  }
  treasury_.mint(work, asset, amount);

  auto tx = transaction_t{};
  tx.type = transaction_type_t::emission;
  tx.asset = asset;
  tx.to_account = target;
  tx.amount = amount;
  tx.net_amount = amount;
  tx.description = description;
  return log_.append(work, std::move(tx));
}

result<transaction_t> emission_service::emit(altyn::ledger::unit_of_work& work,
                                             const identity_t& admin,
                                             const account_id_t& target,
                                             const amount_t& amount,
                                             const std::string& description) {
  if (!admin.is_admin) {
    return make_error<transaction_t>(
        ledger_error_code::unauthorized,
        fmt::format("{} may not emit COIN", admin.user_id), kEmissionCodespace);
  }
  if (amount == 0) {
    return make_error<transaction_t>(ledger_error_code::invalid_amount,
                                     "emission amount must be positive",
                                     kEmissionCodespace);
  }
  return make_result(
      mint(work, asset_type_t::coin, target, amount,
           description.empty() ? std::string{"Coin emission"} : description));
}

result<std::vector<transaction_t>> emission_service::issue_tokens(
    altyn::ledger::unit_of_work& work,
    const identity_t& admin,
    const account_id_t& target,
    const amount_t& token_amount,
    const amount_t& coin_amount) {
  if (!admin.is_admin) {
    return make_error<std::vector<transaction_t>>(
        ledger_error_code::unauthorized,
        fmt::format("{} may not issue tokens", admin.user_id),
        kEmissionCodespace);
  }
  if (token_amount == 0 && coin_amount == 0) {
    return make_error<std::vector<transaction_t>>(
        ledger_error_code::invalid_amount,
        "token and coin amounts are both zero", kEmissionCodespace);
  }

  auto issued = std::vector<transaction_t>{};
  if (token_amount > 0) {
    issued.push_back(mint(work, asset_type_t::token, target, token_amount,
                          "Initial token allocation"));
  }
  if (coin_amount > 0) {
    issued.push_back(mint(work, asset_type_t::coin, target, coin_amount,
                          "Initial coin allocation"));
  }
  return make_result(std::move(issued));
}

}  // namespace altyn::execution
