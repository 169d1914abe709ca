#pragma once

#include <altyn/execution/identity.hpp>
#include <altyn/execution/transfer_engine.hpp>
#include <altyn/ledger/transaction_log.hpp>
#include <altyn/schema/result.hpp>
#include <altyn/schema/settlement.hpp>
#include <optional>
#include <string>

namespace altyn::execution {

inline constexpr auto kSettlementCodespace =
    std::string_view{"altyn.settlement"};

struct payment_request final {
  identity_t buyer;
  identity_t seller;
  altyn::schema::amount_t amount{};
  altyn::schema::transaction_type_t type{
      altyn::schema::transaction_type_t::marketplace_purchase};
  std::optional<std::string> listing_id;
  std::string description;
};

/// Entry point for marketplace and service payments.
///
/// Moves COIN from buyer to seller through the transfer engine and issues a
/// COMPLETED receipt. A failed payment produces no receipt; the caller must
/// not change its listing state in that case.
class settlement_facade final {
 public:
  settlement_facade(transfer_engine& transfers,
                    altyn::ledger::transaction_log& log);

  altyn::schema::result<altyn::schema::settlement> pay(
      altyn::ledger::unit_of_work& work,
      const payment_request& request);

 private:
  transfer_engine& transfers_;
  altyn::ledger::transaction_log& log_;
};

}  // namespace altyn::execution
