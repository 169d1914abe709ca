#pragma once
#include <cstdint>
#include <string>

// Outcome of replaying the transaction log against stored state.
namespace altyn::schema {

struct audit_report final {
  bool ok{};
  uint64_t transactions{};
  uint64_t wallets{};
  std::string error;
};

}  // namespace altyn::schema
