#pragma once
#include <altyn/schema/transaction.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Read model: one transaction as seen from a particular account.
namespace altyn::schema {

struct history_entry final {
  transaction_t transaction;
  std::string from_name;
  std::string to_name;
  bool is_incoming{};
};

struct history_page final {
  std::vector<history_entry> entries;
  uint64_t total{};
};

}  // namespace altyn::schema
