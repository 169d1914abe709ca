#include <altyn/schema/amount.hpp>

#include <algorithm>
#include <cctype>

namespace altyn::schema {

namespace {

// Guard against absurd inputs; 10^30 whole units is far beyond any supply.
constexpr std::size_t kMaxWholeDigits = 30;

amount_t power_of_ten(uint32_t exponent) {
  auto value = amount_t{1};
  for (uint32_t i = 0; i < exponent; ++i) {
    value *= 10u;
  }
  return value;
}

}  // namespace

const amount_t& amount_scale() {
  static const auto scale = power_of_ten(kAmountDecimals);
  return scale;
}

amount_t quantum(uint32_t places) {
  places = std::min(places, kAmountDecimals);
  return power_of_ten(kAmountDecimals - places);
}

amount_t make_amount(const uint64_t whole, const uint64_t fraction_units) {
  return (amount_t{whole} * amount_scale()) + amount_t{fraction_units};
}

std::optional<amount_t> parse_amount(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto dot = text.find('.');
  auto whole = text.substr(0, dot);
  auto fraction = dot == std::string_view::npos ? std::string_view{}
                                                : text.substr(dot + 1);
  if (whole.empty() || whole.size() > kMaxWholeDigits) {
    return std::nullopt;
  }
  if (dot != std::string_view::npos &&
      (fraction.empty() || fraction.size() > kAmountDecimals)) {
    return std::nullopt;
  }
  auto is_digit = [](const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  };
  if (!std::ranges::all_of(whole, is_digit) ||
      !std::ranges::all_of(fraction, is_digit)) {
    return std::nullopt;
  }

  auto value = amount_t{};
  for (const auto c : whole) {
    value = (value * 10u) + static_cast<unsigned>(c - '0');
  }
  value *= amount_scale();

  auto fraction_units = amount_t{};
  for (const auto c : fraction) {
    fraction_units = (fraction_units * 10u) + static_cast<unsigned>(c - '0');
  }
  fraction_units *= power_of_ten(kAmountDecimals -
                                 static_cast<uint32_t>(fraction.size()));
  return value + fraction_units;
}

std::string format_amount(const amount_t& value, uint32_t places) {
  places = std::min(places, kAmountDecimals);
  auto rounded = round_half_up(value, places);
  auto whole = rounded / amount_scale();
  auto out = whole.str();
  if (places == 0) {
    return out;
  }
  auto fraction = (rounded % amount_scale()) / quantum(places);
  auto digits = fraction.str();
  out.push_back('.');
  out.append(places - digits.size(), '0');
  out.append(digits);
  return out;
}

std::string format_display(const amount_t& value) {
  auto out = format_amount(value, kAmountDecimals);
  auto minimum = out.size() - (kAmountDecimals - kCoinDecimals);
  while (out.size() > minimum && out.back() == '0') {
    out.pop_back();
  }
  return out;
}

amount_t divide_half_up(const amount_t& dividend, const amount_t& divisor) {
  return ((dividend * 2u) + divisor) / (divisor * 2u);
}

amount_t round_half_up(const amount_t& value, const uint32_t places) {
  auto step = quantum(places);
  if (step == 1u) {
    return value;
  }
  return divide_half_up(value, step) * step;
}

amount_t multiply(const amount_t& lhs, const amount_t& rhs) {
  return divide_half_up(lhs * rhs, amount_scale());
}

amount_t pro_rata(const amount_t& pool,
                  const amount_t& part,
                  const amount_t& whole,
                  const uint32_t places) {
  if (whole == 0u) {
    return amount_t{};
  }
  auto step = quantum(places);
  return divide_half_up(pool * part, whole * step) * step;
}

amount_t fee_for(const amount_t& amount) {
  auto step = quantum(kCoinDecimals);
  return divide_half_up(amount * kFeeRateNumerator,
                        amount_t{kFeeRateDenominator} * step) *
         step;
}

amount_t percentage_of(const amount_t& part, const amount_t& whole) {
  return pro_rata(make_amount(100), part, whole, kPercentageDecimals);
}

}  // namespace altyn::schema
