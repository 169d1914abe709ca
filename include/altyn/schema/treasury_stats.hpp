#pragma once
#include <altyn/schema/dividend_payout.hpp>
#include <altyn/schema/transaction.hpp>
#include <altyn/schema/treasury_state.hpp>
#include <vector>

namespace altyn::schema {

struct treasury_stats final {
  treasury_state_t treasury;
  std::vector<transaction_t> recent_emissions;
  std::vector<dividend_payout_t> recent_dividends;
};

}  // namespace altyn::schema
