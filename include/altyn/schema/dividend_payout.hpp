#pragma once
#include <altyn/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: dividend payout.
// One distribution run. The amounts in distribution_details sum exactly to
// total_distributed.
namespace altyn::schema {

template <uint16_t Version>
struct dividend_share;

template <>
struct dividend_share<1> final {
  uint16_t version{1};
  account_id_t account_id;
  amount_t token_balance{};
  amount_t token_percentage{};
  amount_t amount{};
};

using dividend_share_t = dividend_share<1>;

template <uint16_t Version>
struct dividend_payout;

template <>
struct dividend_payout<1> final {
  uint16_t version{1};
  std::string id;
  uint64_t sequence{};
  timestamp_milliseconds_t created_at{};
  amount_t total_distributed{};
  uint64_t holders_count{};
  std::vector<dividend_share_t> distribution_details;
};

using dividend_payout_t = dividend_payout<1>;

}  // namespace altyn::schema
