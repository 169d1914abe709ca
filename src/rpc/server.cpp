#include <spdlog/spdlog.h>
#include <altyn/rpc/server.hpp>
#include <altyn/rpc/translate.hpp>
#include <altyn/schema/amount.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace altyn::rpc;
using namespace altyn::schema;
namespace v1 = altyn::ledger::v1;

namespace {

constexpr uint32_t kDefaultHistoryLimit = 20;

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

template <typename Response>
grpc::ServerUnaryReactor* reject_amount(grpc::CallbackServerContext* context,
                                        const std::string& field,
                                        const std::string& value,
                                        Response* response) {
  spdlog::debug("Rejected request with unparsable {} '{}'", field, value);
  set_invalid_argument(ledger_error_code::invalid_amount,
                       "invalid " + field + " '" + value + "'", response);
  return finish_ok(context);
}

std::optional<std::string> optional_text(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

listener::listener(altyn::execution::engine& engine) : engine_{engine} {}

grpc::ServerUnaryReactor* listener::Transfer(
    grpc::CallbackServerContext* context,
    const v1::TransferRequest* request,
    v1::TransactionResponse* response) {
  auto asset = request->asset_type().empty()
                   ? std::optional{asset_type_t::coin}
                   : try_from_string<asset_type_t>(request->asset_type());
  if (!asset) {
    set_invalid_argument(ledger_error_code::unsupported_asset,
                         "unknown asset type '" + request->asset_type() + "'",
                         response);
    return finish_ok(context);
  }
  auto amount = parse_positive_amount(request->amount());
  if (!amount) {
    return reject_amount(context, "amount", request->amount(), response);
  }
  auto result = engine_.transfer(request->from_user_id(),
                                 request->to_account(), *asset, *amount,
                                 request->description(),
                                 make_deadline(request->timeout_ms()));
  set_status(result, response);
  if (result.value) {
    to_proto(*result.value, response->mutable_transaction());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CorporateTransfer(
    grpc::CallbackServerContext* context,
    const v1::CorporateTransferRequest* request,
    v1::TransactionResponse* response) {
  auto amount = parse_positive_amount(request->amount());
  if (!amount) {
    return reject_amount(context, "amount", request->amount(), response);
  }
  auto result = engine_.corporate_transfer(
      request->actor_id(), request->organization_id(), request->to_account(),
      *amount, request->description(), make_deadline(request->timeout_ms()));
  set_status(result, response);
  if (result.value) {
    to_proto(*result.value, response->mutable_transaction());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Pay(grpc::CallbackServerContext* context,
                                        const v1::PayRequest* request,
                                        v1::PayResponse* response) {
  auto payment_type = try_from_string<transaction_type_t>(request->payment_type());
  if (!payment_type) {
    set_invalid_argument(
        ledger_error_code::invalid_payment_type,
        "unknown payment type '" + request->payment_type() + "'", response);
    return finish_ok(context);
  }
  auto amount = parse_positive_amount(request->amount());
  if (!amount) {
    return reject_amount(context, "amount", request->amount(), response);
  }
  auto result = engine_.pay(request->buyer_id(), request->seller_account(),
                            *amount, *payment_type,
                            optional_text(request->listing_id()),
                            request->description(),
                            make_deadline(request->timeout_ms()));
  set_status(result, response);
  if (result.value) {
    to_proto(result.value->transaction, response->mutable_transaction());
    to_proto(result.value->receipt, response->mutable_receipt());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Emit(grpc::CallbackServerContext* context,
                                         const v1::EmitRequest* request,
                                         v1::TransactionResponse* response) {
  auto amount = parse_positive_amount(request->amount());
  if (!amount) {
    return reject_amount(context, "amount", request->amount(), response);
  }
  auto result = engine_.emit(request->admin_id(), request->target_account(),
                             *amount, request->description(),
                             make_deadline(request->timeout_ms()));
  set_status(result, response);
  if (result.value) {
    to_proto(*result.value, response->mutable_transaction());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IssueTokens(
    grpc::CallbackServerContext* context,
    const v1::IssueTokensRequest* request,
    v1::IssueTokensResponse* response) {
  auto token_amount = parse_optional_amount(request->token_amount());
  if (!token_amount) {
    return reject_amount(context, "token amount", request->token_amount(),
                         response);
  }
  auto coin_amount = parse_optional_amount(request->coin_amount());
  if (!coin_amount) {
    return reject_amount(context, "coin amount", request->coin_amount(),
                         response);
  }
  auto result = engine_.issue_tokens(
      request->admin_id(), request->target_account(), *token_amount,
      *coin_amount, make_deadline(request->timeout_ms()));
  set_status(result, response);
  if (result.value) {
    for (const auto& tx : *result.value) {
      to_proto(tx, response->add_transactions());
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Distribute(
    grpc::CallbackServerContext* context,
    const v1::DistributeRequest* request,
    v1::DistributeResponse* response) {
  auto result = engine_.distribute(request->admin_id(),
                                   make_deadline(request->timeout_ms()));
  set_status(result, response);
  if (result.value) {
    to_proto(*result.value, response->mutable_payout());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetWallet(
    grpc::CallbackServerContext* context,
    const v1::GetWalletRequest* request,
    v1::WalletResponse* response) {
  auto result = engine_.get_wallet(request->user_id());
  set_status(result, response);
  if (result.value) {
    to_proto(*result.value, response->mutable_wallet());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetCorporateWallet(
    grpc::CallbackServerContext* context,
    const v1::GetCorporateWalletRequest* request,
    v1::WalletResponse* response) {
  auto result = engine_.get_corporate_wallet(request->actor_id(),
                                             request->organization_id());
  set_status(result, response);
  if (result.value) {
    to_proto(*result.value, response->mutable_wallet());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetPortfolio(
    grpc::CallbackServerContext* context,
    const v1::GetPortfolioRequest* request,
    v1::PortfolioResponse* response) {
  auto result = engine_.get_portfolio(request->user_id());
  set_status(result, response);
  if (result.value) {
    const auto& portfolio = *result.value;
    auto* wallet = response->mutable_wallet();
    wallet->set_account_id(portfolio.account_id);
    wallet->set_coin_balance(format_display(portfolio.coin_balance));
    wallet->set_token_balance(format_display(portfolio.token_balance));
    wallet->set_token_percentage(
        format_amount(portfolio.token_percentage, kPercentageDecimals));
    wallet->set_pending_dividends(
        format_amount(portfolio.pending_dividends, kCoinDecimals));
    wallet->set_dividends_received(format_display(portfolio.dividends_received));
    for (const auto& valuation : portfolio.coin_valuations) {
      auto* value = response->add_coin_valuations();
      value->set_currency(valuation.currency);
      value->set_value(format_amount(valuation.value, kCoinDecimals));
    }
    for (const auto& rate : portfolio.rates) {
      to_proto(rate, response->add_rates());
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetTransactions(
    grpc::CallbackServerContext* context,
    const v1::GetTransactionsRequest* request,
    v1::TransactionsResponse* response) {
  auto limit = request->limit() == 0 ? kDefaultHistoryLimit : request->limit();
  auto result =
      engine_.get_transactions(request->user_id(), limit, request->offset());
  set_status(result, response);
  if (result.value) {
    for (const auto& entry : result.value->entries) {
      to_proto(entry, response->add_entries());
    }
    response->set_total(result.value->total);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetTokenHolders(
    grpc::CallbackServerContext* context,
    const v1::GetTokenHoldersRequest* request,
    v1::TokenHoldersResponse* response) {
  auto holders = engine_.get_token_holders(request->limit());
  for (const auto& holder : holders.holders) {
    auto* out = response->add_holders();
    out->set_account_id(holder.account_id);
    out->set_display_name(holder.display_name);
    out->set_token_balance(format_display(holder.token_balance));
    out->set_percentage(format_amount(holder.percentage, kPercentageDecimals));
  }
  response->set_holders_count(holders.holders_count);
  response->set_total_supply(format_display(holders.total_supply));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetTreasuryStats(
    grpc::CallbackServerContext* context,
    const v1::GetTreasuryStatsRequest* request,
    v1::TreasuryStatsResponse* response) {
  auto result = engine_.get_treasury_stats(request->admin_id());
  set_status(result, response);
  if (result.value) {
    const auto& treasury = result.value->treasury;
    response->set_collected_fees(
        format_amount(treasury.collected_fees, kCoinDecimals));
    response->set_total_coins_in_circulation(
        format_display(treasury.total_coins_in_circulation));
    response->set_total_token_supply(
        format_display(treasury.total_token_supply));
    response->set_lifetime_fees(
        format_amount(treasury.lifetime_fees, kCoinDecimals));
    response->set_lifetime_dividends(
        format_amount(treasury.lifetime_dividends, kCoinDecimals));
    for (const auto& tx : result.value->recent_emissions) {
      to_proto(tx, response->add_recent_emissions());
    }
    for (const auto& payout : result.value->recent_dividends) {
      to_proto(payout, response->add_recent_dividends());
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetReceipt(
    grpc::CallbackServerContext* context,
    const v1::GetReceiptRequest* request,
    v1::ReceiptResponse* response) {
  auto result = engine_.get_receipt(request->receipt_id());
  set_status(result, response);
  if (result.value) {
    to_proto(*result.value, response->mutable_receipt());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetRates(
    grpc::CallbackServerContext* context,
    const v1::GetRatesRequest* /*request*/,
    v1::RatesResponse* response) {
  for (const auto& rate : engine_.get_rates()) {
    to_proto(rate, response->add_rates());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Convert(
    grpc::CallbackServerContext* context,
    const v1::ConvertRequest* request,
    v1::ConvertResponse* response) {
  auto amount = parse_amount(request->amount());
  if (!amount) {
    return reject_amount(context, "amount", request->amount(), response);
  }
  auto result = engine_.convert(*amount, request->currency());
  set_status(result, response);
  if (result.value) {
    response->set_value(format_amount(*result.value, kCoinDecimals));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::UpdateRates(
    grpc::CallbackServerContext* context,
    const v1::UpdateRatesRequest* request,
    v1::RatesResponse* response) {
  auto rates = std::vector<exchange_rate>{};
  for (const auto& rate : request->rates()) {
    auto value = parse_positive_amount(rate.rate());
    if (!value) {
      return reject_amount(context, "rate for " + rate.currency(), rate.rate(),
                           response);
    }
    rates.push_back(exchange_rate{.currency = rate.currency(), .rate = *value});
  }
  auto result = engine_.update_rates(request->admin_id(), rates);
  set_status(result, response);
  if (result.value) {
    for (const auto& rate : *result.value) {
      to_proto(rate, response->add_rates());
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Audit(grpc::CallbackServerContext* context,
                                          const v1::AuditRequest* request,
                                          v1::AuditResponse* response) {
  auto result = engine_.audit(request->admin_id());
  set_status(result, response);
  if (result.value) {
    response->set_ok(result.value->ok);
    response->set_transactions(result.value->transactions);
    response->set_wallets(result.value->wallets);
    response->set_error(result.value->error);
  }
  return finish_ok(context);
}
