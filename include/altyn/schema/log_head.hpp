#pragma once
#include <altyn/schema/primitives.hpp>

// Schema type: log head.
// Tip of the transaction log: last sequence, its hash, and the last dividend
// payout sequence.
namespace altyn::schema {

template <uint16_t Version>
struct log_head;

template <>
struct log_head<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  hash32_t hash{};
  uint64_t payout_sequence{};
};

using log_head_t = log_head<1>;

}  // namespace altyn::schema
