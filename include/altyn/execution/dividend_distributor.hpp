#pragma once

#include <altyn/execution/identity.hpp>
#include <altyn/execution/transfer_engine.hpp>
#include <altyn/ledger/transaction_log.hpp>
#include <altyn/ledger/treasury.hpp>
#include <altyn/ledger/wallet_store.hpp>
#include <altyn/schema/dividend_payout.hpp>
#include <altyn/schema/result.hpp>

namespace altyn::execution {

inline constexpr auto kDividendCodespace = std::string_view{"altyn.dividend"};

/// Pays the treasury fee pool out to TOKEN holders in proportion to their
/// holdings.
///
/// Each holder's share is `pool * balance / supply` rounded half-up to cents
/// in a single step. The rounding remainder is settled against holders in
/// rank order (largest balance first, ties by account id), so the pool always
/// empties exactly. Holders whose share rounds to zero appear in the payout
/// details but receive no credit and no log entry.
class dividend_distributor final {
 public:
  dividend_distributor(altyn::ledger::wallet_store& wallets,
                       altyn::ledger::treasury& treasury,
                       altyn::ledger::transaction_log& log,
                       transfer_engine& transfers);

  altyn::schema::result<altyn::schema::dividend_payout_t> distribute(
      altyn::ledger::unit_of_work& work,
      const identity_t& admin);

  /// What `token_balance` would receive if the current pool were paid out.
  altyn::schema::amount_t pending_for(
      const altyn::schema::amount_t& token_balance) const;

 private:
  altyn::ledger::wallet_store& wallets_;
  altyn::ledger::treasury& treasury_;
  altyn::ledger::transaction_log& log_;
  transfer_engine& transfers_;
};

}  // namespace altyn::execution
