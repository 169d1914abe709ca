#pragma once

#include <altyn/ledger/v1/ledger.pb.h>
#include <altyn/schema/dividend_payout.hpp>
#include <altyn/schema/exchange_rate.hpp>
#include <altyn/schema/history_entry.hpp>
#include <altyn/schema/receipt.hpp>
#include <altyn/schema/result.hpp>
#include <altyn/schema/transaction.hpp>
#include <altyn/schema/wallet_view.hpp>
#include <chrono>
#include <optional>
#include <string>

// Conversions between engine types and the wire messages.
namespace altyn::rpc {

inline constexpr auto kRpcCodespace = std::string_view{"altyn.rpc"};

void to_proto(const altyn::schema::transaction_t& source,
              altyn::ledger::v1::Transaction* destination);
void to_proto(const altyn::schema::receipt_t& source,
              altyn::ledger::v1::Receipt* destination);
void to_proto(const altyn::schema::dividend_payout_t& source,
              altyn::ledger::v1::DividendPayout* destination);
void to_proto(const altyn::schema::wallet_view& source,
              altyn::ledger::v1::Wallet* destination);
void to_proto(const altyn::schema::exchange_rate& source,
              altyn::ledger::v1::ExchangeRate* destination);
void to_proto(const altyn::schema::history_entry& source,
              altyn::ledger::v1::HistoryEntry* destination);

/// Copy code, log and codespace of `source` into a response message.
template <typename T, typename Response>
void set_status(const altyn::schema::result<T>& source, Response* destination) {
  destination->set_code(static_cast<uint32_t>(source.code));
  destination->set_log(source.log);
  destination->set_codespace(source.codespace);
}

template <typename Response>
void set_invalid_argument(const altyn::schema::ledger_error_code code,
                          const std::string& log,
                          Response* destination) {
  destination->set_code(static_cast<uint32_t>(code));
  destination->set_log(log);
  destination->set_codespace(std::string{kRpcCodespace});
}

/// Strictly positive decimal amount, or std::nullopt.
std::optional<altyn::schema::amount_t> parse_positive_amount(
    const std::string& text);

/// Empty text reads as zero.
std::optional<altyn::schema::amount_t> parse_optional_amount(
    const std::string& text);

/// No deadline when `timeout_ms` is zero.
std::optional<std::chrono::steady_clock::time_point> make_deadline(
    uint32_t timeout_ms);

}  // namespace altyn::rpc
