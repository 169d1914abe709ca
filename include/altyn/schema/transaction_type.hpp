#pragma once

#include <altyn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction type.
// Fee-bearing types are transfer, marketplace_purchase and service_payment.
namespace altyn::schema {

enum class transaction_type_t : uint8_t {
  transfer = 0,
  emission = 1,
  dividend = 2,
  marketplace_purchase = 3,
  service_payment = 4
};

inline constexpr auto kTransactionTypeMappings =
    std::array{std::pair<std::string_view, transaction_type_t>{
                   "TRANSFER", transaction_type_t::transfer},
               std::pair<std::string_view, transaction_type_t>{
                   "EMISSION", transaction_type_t::emission},
               std::pair<std::string_view, transaction_type_t>{
                   "DIVIDEND", transaction_type_t::dividend},
               std::pair<std::string_view, transaction_type_t>{
                   "MARKETPLACE_PURCHASE",
                   transaction_type_t::marketplace_purchase},
               std::pair<std::string_view, transaction_type_t>{
                   "SERVICE_PAYMENT", transaction_type_t::service_payment}};

template <>
inline std::optional<transaction_type_t> try_from_string<transaction_type_t>(
    const std::string_view value) {
  return from_string(value, kTransactionTypeMappings);
}

inline constexpr std::string_view to_string(const transaction_type_t value) {
  return to_string(value, kTransactionTypeMappings).value_or("unknown");
}

inline constexpr bool is_fee_bearing(const transaction_type_t value) {
  return value == transaction_type_t::transfer ||
         value == transaction_type_t::marketplace_purchase ||
         value == transaction_type_t::service_payment;
}

inline constexpr bool is_payment(const transaction_type_t value) {
  return value == transaction_type_t::marketplace_purchase ||
         value == transaction_type_t::service_payment;
}

}  // namespace altyn::schema
