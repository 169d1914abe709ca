#pragma once
#include <altyn/schema/primitives.hpp>
#include <string>
#include <vector>

namespace altyn::schema {

struct token_holder final {
  account_id_t account_id;
  std::string display_name;
  amount_t token_balance{};
  amount_t percentage{};
};

struct token_holders final {
  std::vector<token_holder> holders;
  uint64_t holders_count{};
  amount_t total_supply{};
};

}  // namespace altyn::schema
