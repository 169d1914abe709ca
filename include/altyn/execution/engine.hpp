#pragma once

#include <altyn/execution/dividend_distributor.hpp>
#include <altyn/execution/emission_service.hpp>
#include <altyn/execution/exchange_rate_provider.hpp>
#include <altyn/execution/identity.hpp>
#include <altyn/execution/settlement_facade.hpp>
#include <altyn/execution/transfer_engine.hpp>
#include <altyn/ledger/transaction_log.hpp>
#include <altyn/ledger/treasury.hpp>
#include <altyn/ledger/unit_of_work.hpp>
#include <altyn/ledger/wallet_store.hpp>
#include <altyn/schema/audit_report.hpp>
#include <altyn/schema/dividend_payout.hpp>
#include <altyn/schema/exchange_rate.hpp>
#include <altyn/schema/history_entry.hpp>
#include <altyn/schema/portfolio.hpp>
#include <altyn/schema/receipt.hpp>
#include <altyn/schema/result.hpp>
#include <altyn/schema/settlement.hpp>
#include <altyn/schema/token_holder.hpp>
#include <altyn/schema/transaction.hpp>
#include <altyn/schema/treasury_stats.hpp>
#include <altyn/schema/wallet_view.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace altyn::execution {

/// Latest point at which a caller still wants its operation to start.
using deadline_t = std::optional<std::chrono::steady_clock::time_point>;

inline constexpr std::size_t kMaxHistoryPage = 100;
inline constexpr std::size_t kRecentStatsLimit = 10;

/// Dual-asset ledger: COIN and TOKEN wallets, the treasury, and the
/// tamper-evident transaction log, persisted in RocksDB.
///
/// Every mutating operation runs under one engine-wide lock, stages its
/// changes in a unit of work and commits them as a single write batch. Reads
/// take the same lock, so they always observe the last committed state.
/// Identities are resolved before that lock is taken.
class engine final {
 public:
  /// Open (or create) the ledger database at `db_path` and load its state.
  /// A read-only engine answers queries and fails every mutation with
  /// storage_failure.
  explicit engine(
      std::string db_path,
      identity_resolver_t identities = {},
      const std::vector<altyn::schema::exchange_rate>& rates = default_rates(),
      altyn::storage::open_mode mode = altyn::storage::open_mode::read_write);

  /// Move `amount` of `asset` between two users. TOKEN moves are reserved
  /// for administrators.
  altyn::schema::result<altyn::schema::transaction_t> transfer(
      const std::string_view& from_user_id,
      const std::string_view& to_account,
      altyn::schema::asset_type_t asset,
      const altyn::schema::amount_t& amount,
      const std::string& description,
      const deadline_t& deadline = std::nullopt);

  /// COIN transfer out of an organization's wallet by one of its operators.
  altyn::schema::result<altyn::schema::transaction_t> corporate_transfer(
      const std::string_view& actor_id,
      const std::string_view& organization_id,
      const std::string_view& to_account,
      const altyn::schema::amount_t& amount,
      const std::string& description,
      const deadline_t& deadline = std::nullopt);

  /// Settle a marketplace purchase or service payment and issue a receipt.
  altyn::schema::result<altyn::schema::settlement> pay(
      const std::string_view& buyer_id,
      const std::string_view& seller_account,
      const altyn::schema::amount_t& amount,
      altyn::schema::transaction_type_t payment_type,
      const std::optional<std::string>& listing_id,
      const std::string& description,
      const deadline_t& deadline = std::nullopt);

  altyn::schema::result<altyn::schema::transaction_t> emit(
      const std::string_view& admin_id,
      const std::string_view& target_account,
      const altyn::schema::amount_t& amount,
      const std::string& description,
      const deadline_t& deadline = std::nullopt);

  altyn::schema::result<std::vector<altyn::schema::transaction_t>>
  issue_tokens(const std::string_view& admin_id,
               const std::string_view& target_account,
               const altyn::schema::amount_t& token_amount,
               const altyn::schema::amount_t& coin_amount,
               const deadline_t& deadline = std::nullopt);

  altyn::schema::result<altyn::schema::dividend_payout_t> distribute(
      const std::string_view& admin_id,
      const deadline_t& deadline = std::nullopt);

  /// Committed balance; zero for unknown accounts.
  altyn::schema::amount_t get_balance(const std::string_view& account_id,
                                      altyn::schema::asset_type_t asset) const;

  altyn::schema::result<altyn::schema::wallet_view> get_wallet(
      const std::string_view& user_id) const;

  altyn::schema::result<altyn::schema::wallet_view> get_corporate_wallet(
      const std::string_view& actor_id,
      const std::string_view& organization_id) const;

  altyn::schema::result<altyn::schema::portfolio> get_portfolio(
      const std::string_view& user_id) const;

  /// Newest first. `limit` is capped at kMaxHistoryPage.
  altyn::schema::result<altyn::schema::history_page> get_transactions(
      const std::string_view& user_id,
      std::size_t limit,
      std::size_t offset = 0) const;

  /// Holders ranked by balance. A `limit` of zero returns all of them.
  altyn::schema::token_holders get_token_holders(std::size_t limit) const;

  altyn::schema::result<altyn::schema::treasury_stats> get_treasury_stats(
      const std::string_view& admin_id) const;

  altyn::schema::result<altyn::schema::transaction_t> get_transaction(
      const std::string_view& transaction_id) const;

  altyn::schema::result<altyn::schema::receipt_t> get_receipt(
      const std::string_view& receipt_id) const;

  std::vector<altyn::schema::exchange_rate> get_rates() const;

  altyn::schema::result<altyn::schema::amount_t> convert(
      const altyn::schema::amount_t& coin_amount,
      const std::string_view& currency) const;

  altyn::schema::result<std::vector<altyn::schema::exchange_rate>>
  update_rates(const std::string_view& admin_id,
               const std::vector<altyn::schema::exchange_rate>& rates);

  /// Replay the persisted log against stored state.
  altyn::schema::result<altyn::schema::audit_report> audit(
      const std::string_view& admin_id) const;

  /// Replace the identity collaborator. The resolver is never invoked while
  /// the ledger lock is held, so it may call back into the engine.
  void set_identity_resolver(identity_resolver_t identities);

 private:
  template <typename T, typename Operation>
  altyn::schema::result<T> run(std::string_view name,
                               const deadline_t& deadline,
                               Operation&& operation);

  bool commit(altyn::ledger::unit_of_work& work);

  identity_resolver_t identity_resolver() const;

  /// Users known to the identity collaborator.
  std::optional<identity_t> resolve_user(const std::string_view& user_id) const;
  /// Users, plus corporate accounts, which need no lookup.
  std::optional<identity_t> resolve_account(
      const std::string_view& account_id) const;
  std::string display_name_of(
      const std::optional<altyn::schema::account_id_t>& account_id) const;
  altyn::schema::wallet_view make_wallet_view(
      const altyn::schema::account_id_t& account_id,
      const std::string& display_name) const;

  mutable std::timed_mutex mutex_;
  mutable altyn::ledger::encoder_t encoder_;
  altyn::ledger::storage_t storage_;
  altyn::ledger::wallet_store wallets_;
  altyn::ledger::treasury treasury_;
  altyn::ledger::transaction_log log_;
  transfer_engine transfers_;
  emission_service emissions_;
  dividend_distributor dividends_;
  settlement_facade settlements_;
  exchange_rate_provider rates_;
  mutable std::mutex identities_mutex_;
  identity_resolver_t identities_;
};

}  // namespace altyn::execution
