#include <fmt/format.h>
#include <altyn/execution/settlement_facade.hpp>

using namespace altyn::schema;

namespace altyn::execution {

settlement_facade::settlement_facade(transfer_engine& transfers,
                                     altyn::ledger::transaction_log& log)
    : transfers_{transfers}, log_{log} {}

result<settlement> settlement_facade::pay(altyn::ledger::unit_of_work& work,
                                          const payment_request& request) {
  if (!is_payment(request.type)) {
    return make_error<settlement>(
        ledger_error_code::invalid_payment_type,
        fmt::format("{} is not a payment type", to_string(request.type)),
        kSettlementCodespace);
  }

  auto description = request.description;
  if (description.empty()) {
    description = request.type == transaction_type_t::marketplace_purchase
                      ? "Marketplace purchase"
                      : "Service payment";
  }

  auto transferred = transfers_.transfer(
      work, transfer_request{.from_account = request.buyer.user_id,
                             .to_account = request.seller.user_id,
                             .asset = asset_type_t::coin,
                             .amount = request.amount,
                             .type = request.type,
                             .description = std::move(description),
                             .reference = request.listing_id});
  if (!transferred.ok()) {
    auto failed = forward_error<settlement>(transferred);
    if (request.listing_id) {
      failed.log += fmt::format(" (listing {})", *request.listing_id);
    }
    return failed;
  }
  const auto& tx = *transferred.value;

  auto receipt = receipt_t{};
  receipt.receipt_id = make_identifier();
  receipt.transaction_id = tx.id;
  receipt.date = tx.created_at;
  receipt.type = request.type;
  receipt.buyer_id = request.buyer.user_id;
  receipt.buyer_name = request.buyer.display_name;
  receipt.seller_id = request.seller.user_id;
  receipt.seller_name = request.seller.display_name;
  receipt.listing_id = request.listing_id;
  receipt.total_paid = tx.amount;
  receipt.fee_amount = tx.fee;
  receipt.status = receipt_status_t::completed;
  log_.record_receipt(work, receipt);

  return make_result(settlement{.transaction = tx, .receipt = std::move(receipt)});
}

}  // namespace altyn::execution
