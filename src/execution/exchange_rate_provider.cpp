#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <altyn/execution/exchange_rate_provider.hpp>
#include <altyn/schema/amount.hpp>
#include <mutex>

using namespace altyn::schema;

namespace {

constexpr auto kCodespace = std::string_view{"altyn.rates"};

}  // namespace

namespace altyn::execution {

std::vector<exchange_rate> default_rates() {
  return {
      exchange_rate{.currency = "USD", .rate = make_amount(1)},
      exchange_rate{.currency = "RUB", .rate = make_amount(90)},
      exchange_rate{.currency = "KZT", .rate = make_amount(450)},
      exchange_rate{.currency = "EUR", .rate = make_amount(0, 92000000)},
  };
}

exchange_rate_provider::exchange_rate_provider(
    const std::vector<exchange_rate>& rates) {
  for (const auto& [currency, rate] : rates) {
    if (rate != 0) {
      rates_.insert_or_assign(currency, rate);
    }
  }
  rates_.insert_or_assign(std::string{kPegCurrency}, make_amount(1));
}

std::vector<exchange_rate> exchange_rate_provider::get_rates() const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<exchange_rate>{};
  out.reserve(rates_.size());
  out.push_back(exchange_rate{.currency = std::string{kPegCurrency},
                              .rate = rates_.find(kPegCurrency)->second});
  for (const auto& [currency, rate] : rates_) {
    if (currency != kPegCurrency) {
      out.push_back(exchange_rate{.currency = currency, .rate = rate});
    }
  }
  return out;
}

result<amount_t> exchange_rate_provider::convert(
    const amount_t& coin_amount,
    const std::string_view& currency) const {
  auto lock = std::shared_lock{mutex_};
  auto it = rates_.find(currency);
  if (it == std::end(rates_)) {
    return make_error<amount_t>(ledger_error_code::unknown_currency,
                                fmt::format("no rate for '{}'", currency),
                                kCodespace);
  }
  return make_result(multiply(coin_amount, it->second));
}

result<std::vector<exchange_rate>> exchange_rate_provider::update_rates(
    const std::vector<exchange_rate>& rates) {
  for (const auto& [currency, rate] : rates) {
    if (currency.empty()) {
      return make_error<std::vector<exchange_rate>>(
          ledger_error_code::unknown_currency, "empty currency code",
          kCodespace);
    }
    if (rate == 0) {
      return make_error<std::vector<exchange_rate>>(
          ledger_error_code::invalid_amount,
          fmt::format("rate for '{}' must be positive", currency), kCodespace);
    }
  }
  {
    auto lock = std::unique_lock{mutex_};
    for (const auto& [currency, rate] : rates) {
      if (currency == kPegCurrency) {
        continue;
      }
      rates_.insert_or_assign(currency, rate);
    }
  }
  spdlog::info("Exchange rates updated ({} entr{})", rates.size(),
               rates.size() == 1 ? "y" : "ies");
  return make_result(get_rates());
}

}  // namespace altyn::execution
