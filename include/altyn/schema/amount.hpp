#pragma once
#include <altyn/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Fixed-point arithmetic for ledger quantities. Every amount carries
// kAmountDecimals fraction digits; no floating point is involved anywhere.
namespace altyn::schema {

inline constexpr uint32_t kAmountDecimals = 8;
inline constexpr uint32_t kCoinDecimals = 2;
inline constexpr uint32_t kPercentageDecimals = 4;

/// Transfer fee rate, 0.1%, expressed as a ratio.
inline constexpr uint64_t kFeeRateNumerator = 1;
inline constexpr uint64_t kFeeRateDenominator = 1000;

/// Units per whole COIN/TOKEN (10^kAmountDecimals).
const amount_t& amount_scale();

/// 10^(kAmountDecimals - places), the unit size of an amount rounded to
/// `places` fraction digits.
amount_t quantum(uint32_t places);

amount_t make_amount(uint64_t whole, uint64_t fraction_units = 0);

/// Parse a plain decimal ("12", "12.5", "0.00000001"). Signs, exponents,
/// empty input and more than kAmountDecimals fraction digits are rejected.
std::optional<amount_t> parse_amount(std::string_view text);

/// Render with exactly `places` fraction digits, rounding half-up.
std::string format_amount(const amount_t& value,
                          uint32_t places = kAmountDecimals);

/// Full precision with trailing zeros dropped, keeping at least cents:
/// "49.95", "0.00000001", "100.00".
std::string format_display(const amount_t& value);

/// Integer division rounding half-up; `divisor` must be non-zero.
amount_t divide_half_up(const amount_t& dividend, const amount_t& divisor);

amount_t round_half_up(const amount_t& value, uint32_t places);

/// Fixed-point product of two amounts, rounded half-up at kAmountDecimals.
amount_t multiply(const amount_t& lhs, const amount_t& rhs);

/// `pool * part / whole` rounded half-up to `places` fraction digits in one
/// step. Returns zero when `whole` is zero.
amount_t pro_rata(const amount_t& pool,
                  const amount_t& part,
                  const amount_t& whole,
                  uint32_t places);

/// round(amount * 0.001, 2).
amount_t fee_for(const amount_t& amount);

/// Share of `part` in `whole` as a percentage with kPercentageDecimals digits.
amount_t percentage_of(const amount_t& part, const amount_t& whole);

}  // namespace altyn::schema
