#pragma once
#include <altyn/ledger/unit_of_work.hpp>
#include <altyn/schema/asset_type.hpp>
#include <altyn/schema/ledger_error_code.hpp>
#include <altyn/schema/treasury_state.hpp>

namespace altyn::ledger {

/// System account holding the fee pool and global supply figures.
///
/// All changes go through these methods; callers never write the state
/// fields directly.
class treasury final {
 public:
  treasury(encoder_t& encoder, storage_t& storage);

  void load();

  const altyn::schema::treasury_state_t& state() const;
  const altyn::schema::treasury_state_t& staged_state(
      const unit_of_work& work) const;

  /// Add a transfer fee to the pool awaiting distribution.
  void credit_fees(unit_of_work& work, const altyn::schema::amount_t& fee);

  /// Raise COIN circulation or TOKEN supply by a freshly minted amount.
  void mint(unit_of_work& work,
            altyn::schema::asset_type_t asset,
            const altyn::schema::amount_t& amount);

  /// Remove distributed dividends from the pool. Fails with
  /// insufficient_funds if the pool holds less than `amount`.
  altyn::schema::ledger_error_code drain_fees(
      unit_of_work& work,
      const altyn::schema::amount_t& amount);

  void stage(const unit_of_work& work, altyn::storage::write_batch& batch);
  void apply(unit_of_work& work);

 private:
  altyn::schema::treasury_state_t& staged(unit_of_work& work);

  encoder_t& encoder_;
  storage_t& storage_;
  altyn::schema::treasury_state_t state_;
};

}  // namespace altyn::ledger
