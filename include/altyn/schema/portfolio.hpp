#pragma once
#include <altyn/schema/exchange_rate.hpp>
#include <altyn/schema/primitives.hpp>
#include <vector>

// Read model: a wallet valued in every configured display currency.
namespace altyn::schema {

struct portfolio final {
  account_id_t account_id;
  amount_t coin_balance{};
  std::vector<currency_value> coin_valuations;
  amount_t token_balance{};
  amount_t token_percentage{};
  amount_t dividends_received{};
  amount_t pending_dividends{};
  std::vector<exchange_rate> rates;
};

}  // namespace altyn::schema
