#pragma once

#include <altyn/schema/exchange_rate.hpp>
#include <altyn/schema/result.hpp>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace altyn::execution {

/// Built-in display rates: USD 1.0, RUB 90.0, KZT 450.0, EUR 0.92.
std::vector<altyn::schema::exchange_rate> default_rates();

/// Conversion table from COIN to display currencies. USD is always 1.0.
///
/// Refreshes take their own lock so they never wait on ledger settlement.
class exchange_rate_provider final {
 public:
  explicit exchange_rate_provider(
      const std::vector<altyn::schema::exchange_rate>& rates = default_rates());

  /// Current table, USD first, the rest by currency code.
  std::vector<altyn::schema::exchange_rate> get_rates() const;

  /// `coin_amount * rate[currency]`; unknown_currency if not listed.
  altyn::schema::result<altyn::schema::amount_t> convert(
      const altyn::schema::amount_t& coin_amount,
      const std::string_view& currency) const;

  /// Merge `rates` into the table. Rejects zero rates; a USD entry is
  /// ignored since the peg is fixed.
  altyn::schema::result<std::vector<altyn::schema::exchange_rate>>
  update_rates(const std::vector<altyn::schema::exchange_rate>& rates);

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, altyn::schema::amount_t, std::less<>> rates_;
};

}  // namespace altyn::execution
