#pragma once
#include <altyn/schema/primitives.hpp>

// Schema type: wallet state.
// One record per account, created lazily on first credit. Balances are only
// changed through the ledger credit/debit primitives.
namespace altyn::schema {

template <uint16_t Version>
struct wallet_state;

template <>
struct wallet_state<1> final {
  uint16_t version{1};
  account_id_t account_id;
  amount_t coin_balance{};
  amount_t token_balance{};
  amount_t dividends_received{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using wallet_state_t = wallet_state<1>;

}  // namespace altyn::schema
