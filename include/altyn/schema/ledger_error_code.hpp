#pragma once

#include <cstdint>
#include <string_view>

namespace altyn::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  invalid_amount = 1,
  insufficient_funds = 2,
  self_transfer_not_allowed = 3,
  unauthorized = 4,
  nothing_to_distribute = 5,
  not_found = 6,
  unsupported_asset = 7,
  storage_failure = 8,
  deadline_exceeded = 9,
  unknown_currency = 10,
  invalid_payment_type = 11,
};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  switch (value) {
    case ledger_error_code::ok:
      return "ok";
    case ledger_error_code::invalid_amount:
      return "invalid amount";
    case ledger_error_code::insufficient_funds:
      return "insufficient funds";
    case ledger_error_code::self_transfer_not_allowed:
      return "self transfer not allowed";
    case ledger_error_code::unauthorized:
      return "unauthorized";
    case ledger_error_code::nothing_to_distribute:
      return "nothing to distribute";
    case ledger_error_code::not_found:
      return "not found";
    case ledger_error_code::unsupported_asset:
      return "unsupported asset";
    case ledger_error_code::storage_failure:
      return "storage failure";
    case ledger_error_code::deadline_exceeded:
      return "deadline exceeded";
    case ledger_error_code::unknown_currency:
      return "unknown currency";
    case ledger_error_code::invalid_payment_type:
      return "invalid payment type";
  }
  return "unknown";
}

}  // namespace altyn::schema
