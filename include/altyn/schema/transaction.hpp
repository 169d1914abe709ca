#pragma once
#include <altyn/schema/asset_type.hpp>
#include <altyn/schema/primitives.hpp>
#include <altyn/schema/transaction_type.hpp>
#include <optional>
#include <string>

// Schema type: transaction.
// Immutable log row. `hash` chains over `previous_hash` and the encoded body
// so the log can be audited end to end.
namespace altyn::schema {

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  std::string id;
  uint64_t sequence{};
  transaction_type_t type{transaction_type_t::transfer};
  asset_type_t asset{asset_type_t::coin};
  std::optional<account_id_t> from_account;
  account_id_t to_account;
  amount_t amount{};
  amount_t fee{};
  amount_t net_amount{};
  timestamp_milliseconds_t created_at{};
  std::string description;
  std::optional<std::string> reference;
  hash32_t previous_hash{};
  hash32_t hash{};
};

using transaction_t = transaction<1>;

}  // namespace altyn::schema
