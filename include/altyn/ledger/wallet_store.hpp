#pragma once
#include <altyn/ledger/unit_of_work.hpp>
#include <altyn/schema/asset_type.hpp>
#include <altyn/schema/ledger_error_code.hpp>
#include <altyn/schema/wallet_state.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace altyn::ledger {

/// Per-account COIN and TOKEN balances.
///
/// `credit` and `debit` are the only ways a balance changes. Both act on the
/// copy staged in a unit of work; the check and the mutation happen in one
/// call so a debit can never overdraw.
class wallet_store final {
 public:
  wallet_store(encoder_t& encoder, storage_t& storage);

  /// Load every persisted wallet into memory.
  void load();

  /// Committed balance; zero for accounts that have never been touched.
  altyn::schema::amount_t get_balance(const std::string_view& account_id,
                                      altyn::schema::asset_type_t asset) const;

  std::optional<altyn::schema::wallet_state_t> find(
      const std::string_view& account_id) const;

  /// Balance as seen by `work`: staged if touched, committed otherwise.
  altyn::schema::amount_t staged_balance(
      const unit_of_work& work,
      const std::string_view& account_id,
      altyn::schema::asset_type_t asset) const;

  /// Fails with invalid_amount when `amount` is zero.
  altyn::schema::ledger_error_code credit(unit_of_work& work,
                                          const std::string_view& account_id,
                                          altyn::schema::asset_type_t asset,
                                          const altyn::schema::amount_t& amount);

  /// Fails with invalid_amount when `amount` is zero and insufficient_funds
  /// when the staged balance is below `amount`. Nothing changes on failure.
  altyn::schema::ledger_error_code debit(unit_of_work& work,
                                         const std::string_view& account_id,
                                         altyn::schema::asset_type_t asset,
                                         const altyn::schema::amount_t& amount);

  /// Add to the running total of dividends paid to `account_id`.
  void record_dividend(unit_of_work& work,
                       const std::string_view& account_id,
                       const altyn::schema::amount_t& amount);

  /// Wallets with a positive TOKEN balance, largest first, ties by account.
  std::vector<altyn::schema::wallet_state_t> token_holders() const;

  std::size_t size() const;

  void stage(const unit_of_work& work, altyn::storage::write_batch& batch);
  void apply(unit_of_work& work);

 private:
  altyn::schema::wallet_state_t& staged(unit_of_work& work,
                                        const std::string_view& account_id);

  encoder_t& encoder_;
  storage_t& storage_;
  std::map<altyn::schema::account_id_t, altyn::schema::wallet_state_t,
           std::less<>>
      wallets_;
};

}  // namespace altyn::ledger
