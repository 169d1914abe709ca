#pragma once
#include <altyn/schema/dividend_payout.hpp>
#include <altyn/schema/encoding/scale/encoder.hpp>
#include <altyn/schema/log_head.hpp>
#include <altyn/schema/primitives.hpp>
#include <altyn/schema/receipt.hpp>
#include <altyn/schema/transaction.hpp>
#include <altyn/schema/treasury_state.hpp>
#include <altyn/schema/wallet_state.hpp>
#include <altyn/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace altyn::ledger {

using encoder_t = altyn::schema::encoding::scale_encoder_t;
using storage_t =
    altyn::storage::storage<altyn::storage::rocksdb_storage_tag>;

/// Changes staged by one settlement, distribution or emission.
///
/// Stores read their committed state, copy what they touch into the unit and
/// mutate only the copy. The unit is flushed as a single write batch and
/// folded back into the stores only once that batch has committed, so a
/// rejected or failed operation leaves no trace in memory or on disk.
struct unit_of_work final {
  altyn::schema::timestamp_milliseconds_t now{};
  std::map<altyn::schema::account_id_t, altyn::schema::wallet_state_t> wallets;
  std::optional<altyn::schema::treasury_state_t> treasury;
  std::optional<altyn::schema::log_head_t> head;
  std::vector<altyn::schema::transaction_t> transactions;
  std::vector<altyn::schema::receipt_t> receipts;
  std::vector<altyn::schema::dividend_payout_t> payouts;
};

}  // namespace altyn::ledger
