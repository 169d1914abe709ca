#include <altyn/rpc/translate.hpp>
#include <altyn/schema/amount.hpp>

using namespace altyn::schema;

namespace altyn::rpc {

void to_proto(const transaction_t& source,
              altyn::ledger::v1::Transaction* destination) {
  destination->set_id(source.id);
  destination->set_sequence(source.sequence);
  destination->set_type(std::string{to_string(source.type)});
  destination->set_asset_type(std::string{to_string(source.asset)});
  destination->set_from_account(source.from_account.value_or(""));
  destination->set_to_account(source.to_account);
  destination->set_amount(format_display(source.amount));
  destination->set_fee(format_display(source.fee));
  destination->set_net_amount(format_display(source.net_amount));
  destination->set_created_at(to_iso8601(source.created_at));
  destination->set_description(source.description);
  destination->set_reference(source.reference.value_or(""));
  destination->set_hash(to_hex(source.hash));
}

void to_proto(const receipt_t& source,
              altyn::ledger::v1::Receipt* destination) {
  destination->set_receipt_id(source.receipt_id);
  destination->set_transaction_id(source.transaction_id);
  destination->set_date(to_iso8601(source.date));
  destination->set_type(std::string{to_string(source.type)});
  destination->set_buyer_id(source.buyer_id);
  destination->set_buyer_name(source.buyer_name);
  destination->set_seller_id(source.seller_id);
  destination->set_seller_name(source.seller_name);
  destination->set_listing_id(source.listing_id.value_or(""));
  destination->set_total_paid(format_amount(source.total_paid, kCoinDecimals));
  destination->set_fee_amount(format_amount(source.fee_amount, kCoinDecimals));
  destination->set_status(std::string{to_string(source.status)});
}

void to_proto(const dividend_payout_t& source,
              altyn::ledger::v1::DividendPayout* destination) {
  destination->set_id(source.id);
  destination->set_sequence(source.sequence);
  destination->set_created_at(to_iso8601(source.created_at));
  destination->set_total_distributed(
      format_amount(source.total_distributed, kCoinDecimals));
  destination->set_holders_count(source.holders_count);
  for (const auto& share : source.distribution_details) {
    auto* detail = destination->add_distribution_details();
    detail->set_account_id(share.account_id);
    detail->set_token_balance(format_display(share.token_balance));
    detail->set_token_percentage(
        format_amount(share.token_percentage, kPercentageDecimals));
    detail->set_amount(format_amount(share.amount, kCoinDecimals));
  }
}

void to_proto(const wallet_view& source,
              altyn::ledger::v1::Wallet* destination) {
  destination->set_account_id(source.account_id);
  destination->set_display_name(source.display_name);
  destination->set_coin_balance(format_display(source.coin_balance));
  destination->set_token_balance(format_display(source.token_balance));
  destination->set_token_percentage(
      format_amount(source.token_percentage, kPercentageDecimals));
  destination->set_pending_dividends(
      format_amount(source.pending_dividends, kCoinDecimals));
  destination->set_dividends_received(
      format_display(source.dividends_received));
}

void to_proto(const exchange_rate& source,
              altyn::ledger::v1::ExchangeRate* destination) {
  destination->set_currency(source.currency);
  destination->set_rate(format_display(source.rate));
}

void to_proto(const history_entry& source,
              altyn::ledger::v1::HistoryEntry* destination) {
  to_proto(source.transaction, destination->mutable_transaction());
  destination->set_from_name(source.from_name);
  destination->set_to_name(source.to_name);
  destination->set_is_incoming(source.is_incoming);
}

std::optional<amount_t> parse_positive_amount(const std::string& text) {
  auto amount = parse_amount(text);
  if (!amount || *amount == 0) {
    return std::nullopt;
  }
  return amount;
}

std::optional<amount_t> parse_optional_amount(const std::string& text) {
  if (text.empty()) {
    return amount_t{};
  }
  return parse_amount(text);
}

std::optional<std::chrono::steady_clock::time_point> make_deadline(
    const uint32_t timeout_ms) {
  if (timeout_ms == 0) {
    return std::nullopt;
  }
  return std::chrono::steady_clock::now() +
         std::chrono::milliseconds{timeout_ms};
}

}  // namespace altyn::rpc
