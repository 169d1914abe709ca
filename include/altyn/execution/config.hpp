#pragma once

#include <altyn/execution/exchange_rate_provider.hpp>
#include <altyn/execution/static_directory.hpp>
#include <istream>
#include <string>
#include <vector>

namespace altyn::execution {

/// Ledger settings read from an INI-style file:
///
///   rates.RUB = 90.0
///   user = alice,Alice Smith,admin,acme;globex
///
/// Rates listed in the file replace the built-in defaults of the same
/// currency; the rest of the defaults stay.
struct ledger_config final {
  std::vector<altyn::schema::exchange_rate> rates = default_rates();
  static_directory directory;
};

/// Throws std::runtime_error on a malformed rate or directory entry.
ledger_config parse_ledger_config(std::istream& input);

ledger_config load_ledger_config(const std::string& path);

}  // namespace altyn::execution
