#pragma once
#include <altyn/ledger/unit_of_work.hpp>
#include <altyn/schema/audit_report.hpp>

namespace altyn::ledger {

/// Replay the persisted log from sequence 1 and check it against the stored
/// wallets, treasury and log head.
///
/// Verifies the hash chain, rebuilds every balance and supply figure from the
/// log alone, and checks that wallet COIN plus the fee pool equals COIN in
/// circulation and that TOKEN balances sum to the TOKEN supply.
altyn::schema::audit_report audit_ledger(encoder_t& encoder,
                                         const storage_t& storage);

}  // namespace altyn::ledger
