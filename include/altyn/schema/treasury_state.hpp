#pragma once
#include <altyn/schema/primitives.hpp>

// Schema type: treasury state.
// Singleton record. Conservation: the sum of all wallet COIN balances plus
// collected_fees equals total_coins_in_circulation.
namespace altyn::schema {

template <uint16_t Version>
struct treasury_state;

template <>
struct treasury_state<1> final {
  uint16_t version{1};
  amount_t collected_fees{};
  amount_t total_coins_in_circulation{};
  amount_t total_token_supply{};
  amount_t lifetime_fees{};
  amount_t lifetime_dividends{};
};

using treasury_state_t = treasury_state<1>;

}  // namespace altyn::schema
