#pragma once

#include <altyn/ledger/transaction_log.hpp>
#include <altyn/ledger/treasury.hpp>
#include <altyn/ledger/unit_of_work.hpp>
#include <altyn/ledger/wallet_store.hpp>
#include <altyn/schema/asset_type.hpp>
#include <altyn/schema/result.hpp>
#include <altyn/schema/transaction.hpp>
#include <optional>
#include <string>

namespace altyn::execution {

inline constexpr auto kTransferCodespace = std::string_view{"altyn.transfer"};

struct transfer_request final {
  altyn::schema::account_id_t from_account;
  altyn::schema::account_id_t to_account;
  altyn::schema::asset_type_t asset{altyn::schema::asset_type_t::coin};
  altyn::schema::amount_t amount{};
  altyn::schema::transaction_type_t type{
      altyn::schema::transaction_type_t::transfer};
  std::string description;
  std::optional<std::string> reference;
};

/// Moves one asset between two wallets.
///
/// The sender is debited the gross amount, the recipient credited the amount
/// net of the fee, and the fee goes to the treasury pool. COIN pays
/// round(amount * 0.001, 2); TOKEN moves carry no fee. Every step is staged
/// in the caller's unit of work together with the log entry.
class transfer_engine final {
 public:
  transfer_engine(altyn::ledger::wallet_store& wallets,
                  altyn::ledger::treasury& treasury,
                  altyn::ledger::transaction_log& log);

  altyn::schema::result<altyn::schema::transaction_t> transfer(
      altyn::ledger::unit_of_work& work,
      const transfer_request& request);

  /// Credit a dividend from the treasury pool to `account_id` and log it.
  /// Draining the pool is left to the caller, once per distribution.
  altyn::schema::result<altyn::schema::transaction_t> pay_dividend(
      altyn::ledger::unit_of_work& work,
      const altyn::schema::account_id_t& account_id,
      const altyn::schema::amount_t& amount,
      const std::string& payout_id);

 private:
  altyn::ledger::wallet_store& wallets_;
  altyn::ledger::treasury& treasury_;
  altyn::ledger::transaction_log& log_;
};

}  // namespace altyn::execution
