#pragma once
#include <altyn/schema/primitives.hpp>
#include <altyn/schema/receipt_status.hpp>
#include <altyn/schema/transaction_type.hpp>
#include <optional>
#include <string>

// Schema type: receipt.
// Buyer-facing record of a settled marketplace or service payment.
namespace altyn::schema {

template <uint16_t Version>
struct receipt;

template <>
struct receipt<1> final {
  uint16_t version{1};
  std::string receipt_id;
  std::string transaction_id;
  timestamp_milliseconds_t date{};
  transaction_type_t type{transaction_type_t::marketplace_purchase};
  account_id_t buyer_id;
  std::string buyer_name;
  account_id_t seller_id;
  std::string seller_name;
  std::optional<std::string> listing_id;
  amount_t total_paid{};
  amount_t fee_amount{};
  receipt_status_t status{receipt_status_t::completed};
};

using receipt_t = receipt<1>;

}  // namespace altyn::schema
