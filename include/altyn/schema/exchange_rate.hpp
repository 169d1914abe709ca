#pragma once
#include <altyn/schema/primitives.hpp>
#include <string>

namespace altyn::schema {

/// Units of `currency` per one COIN.
struct exchange_rate final {
  std::string currency;
  amount_t rate{};
};

/// COIN balance expressed in one display currency.
struct currency_value final {
  std::string currency;
  amount_t value{};
};

inline constexpr auto kPegCurrency = std::string_view{"USD"};

}  // namespace altyn::schema
