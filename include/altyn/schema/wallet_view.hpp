#pragma once
#include <altyn/schema/primitives.hpp>
#include <string>

// Read model for the wallet endpoint.
namespace altyn::schema {

struct wallet_view final {
  account_id_t account_id;
  std::string display_name;
  amount_t coin_balance{};
  amount_t token_balance{};
  amount_t token_percentage{};
  amount_t pending_dividends{};
  amount_t dividends_received{};
};

}  // namespace altyn::schema
