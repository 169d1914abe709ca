#pragma once

#include <altyn/execution/identity.hpp>
#include <altyn/ledger/transaction_log.hpp>
#include <altyn/ledger/treasury.hpp>
#include <altyn/ledger/wallet_store.hpp>
#include <altyn/schema/result.hpp>
#include <altyn/schema/transaction.hpp>
#include <string>
#include <vector>

namespace altyn::execution {

inline constexpr auto kEmissionCodespace = std::string_view{"altyn.emission"};

/// Admin-only minting of COIN and TOKEN. Every minted amount raises the
/// matching treasury supply figure and is logged as an EMISSION.
class emission_service final {
 public:
  emission_service(altyn::ledger::wallet_store& wallets,
                   altyn::ledger::treasury& treasury,
                   altyn::ledger::transaction_log& log);

  altyn::schema::result<altyn::schema::transaction_t> emit(
      altyn::ledger::unit_of_work& work,
      const identity_t& admin,
      const altyn::schema::account_id_t& target,
      const altyn::schema::amount_t& amount,
      const std::string& description);

  /// Initial allocation of TOKEN and, optionally, COIN to one account. At
  /// least one of the two amounts must be non-zero. TOKEN is logged first.
  altyn::schema::result<std::vector<altyn::schema::transaction_t>>
  issue_tokens(altyn::ledger::unit_of_work& work,
               const identity_t& admin,
               const altyn::schema::account_id_t& target,
               const altyn::schema::amount_t& token_amount,
               const altyn::schema::amount_t& coin_amount);

 private:
  const altyn::schema::transaction_t& mint(
      altyn::ledger::unit_of_work& work,
      altyn::schema::asset_type_t asset,
      const altyn::schema::account_id_t& target,
      const altyn::schema::amount_t& amount,
      const std::string& description);

  altyn::ledger::wallet_store& wallets_;
  altyn::ledger::treasury& treasury_;
  altyn::ledger::transaction_log& log_;
};

}  // namespace altyn::execution
