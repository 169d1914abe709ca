#pragma once
#include <altyn/schema/receipt.hpp>
#include <altyn/schema/transaction.hpp>

namespace altyn::schema {

/// A completed payment: the logged transaction and the buyer's receipt.
struct settlement final {
  transaction_t transaction;
  receipt_t receipt;
};

}  // namespace altyn::schema
