#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <altyn/execution/engine.hpp>
#include <altyn/ledger/audit.hpp>
#include <altyn/schema/amount.hpp>
#include <algorithm>
#include <utility>

using namespace altyn::schema;

namespace {

constexpr auto kEngineCodespace = std::string_view{"altyn.engine"};
constexpr auto kQueryCodespace = std::string_view{"altyn.query"};
constexpr auto kTreasuryName = std::string_view{"Treasury"};

template <typename T>
result<T> unknown_account(const std::string_view& account_id,
                          const std::string_view& codespace) {
  return make_error<T>(ledger_error_code::not_found,
                       fmt::format("unknown account '{}'", account_id),
                       codespace);
}

template <typename T>
result<T> not_admin(const std::string_view& user_id,
                    const std::string_view& codespace) {
  return make_error<T>(ledger_error_code::unauthorized,
                       fmt::format("{} is not an administrator", user_id),
                       codespace);
}

}  // namespace

namespace altyn::execution {

engine::engine(std::string db_path,
               identity_resolver_t identities,
               const std::vector<exchange_rate>& rates,
               const altyn::storage::open_mode mode)
    : storage_{altyn::storage::make_storage<
          altyn::storage::rocksdb_storage_tag>(db_path, mode)},
      wallets_{encoder_, storage_},
      treasury_{encoder_, storage_},
      log_{encoder_, storage_},
      transfers_{wallets_, treasury_, log_},
      emissions_{wallets_, treasury_, log_},
      dividends_{wallets_, treasury_, log_, transfers_},
      settlements_{transfers_, log_},
      rates_{rates},
      identities_{std::move(identities)} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing ledger engine with RocksDB path '{}'", db_path);
  wallets_.load();
  treasury_.load();
  log_.load();
  spdlog::info("Ledger engine ready at sequence {} with {} wallet(s)",
               log_.head().sequence, wallets_.size());
}

void engine::set_identity_resolver(identity_resolver_t identities) {
  auto lock = std::scoped_lock{identities_mutex_};
  identities_ = std::move(identities);
}

identity_resolver_t engine::identity_resolver() const {
  auto lock = std::scoped_lock{identities_mutex_};
  return identities_;
}

template <typename T, typename Operation>
result<T> engine::run(const std::string_view name,
                      const deadline_t& deadline,
                      Operation&& operation) {
  auto lock = std::unique_lock{mutex_, std::defer_lock};
  if (deadline) {
    if (std::chrono::steady_clock::now() >= *deadline ||
        !lock.try_lock_until(*deadline)) {
      spdlog::warn("{} abandoned: deadline passed before the ledger lock",
                   name);
      return make_error<T>(ledger_error_code::deadline_exceeded,
                           "deadline exceeded before the operation started",
                           kEngineCodespace);
    }
  } else {
    lock.lock();
  }

  auto work = altyn::ledger::unit_of_work{};
  work.now = now_milliseconds();
  auto outcome = operation(work);
  if (!outcome.ok()) {
    spdlog::warn("{} rejected ({}): {}", name, to_string(outcome.code),
                 outcome.log);
    return outcome;
  }
  if (!commit(work)) {
    return make_error<T>(ledger_error_code::storage_failure,
                         fmt::format("{} could not be persisted", name),
                         kEngineCodespace);
  }
  spdlog::info("{} committed: {} transaction(s), log at sequence {}", name,
               work.transactions.size(), log_.head().sequence);
  return outcome;
}

bool engine::commit(altyn::ledger::unit_of_work& work) {
  auto batch = altyn::storage::write_batch{};
  wallets_.stage(work, batch);
  treasury_.stage(work, batch);
  log_.stage(work, batch);
  if (!storage_.write(batch)) {
    spdlog::error("Discarding {} staged transaction(s) after a failed write",
                  work.transactions.size());
    return false;
  }
  wallets_.apply(work);
  treasury_.apply(work);
  log_.apply(work);
  return true;
}

std::optional<identity_t> engine::resolve_user(
    const std::string_view& user_id) const {
  if (user_id.empty() || is_corporate_account(user_id)) {
    return std::nullopt;
  }
  auto identities = identity_resolver();
  if (!identities) {
    return std::nullopt;
  }
  return identities(user_id);
}

std::optional<identity_t> engine::resolve_account(
    const std::string_view& account_id) const {
  if (is_corporate_account(account_id)) {
    auto organization_id = account_id.substr(kCorporateAccountPrefix.size());
    if (organization_id.empty()) {
      return std::nullopt;
    }
    return identity_t{.user_id = account_id_t{account_id},
                      .display_name = std::string{organization_id}};
  }
  return resolve_user(account_id);
}

std::string engine::display_name_of(
    const std::optional<account_id_t>& account_id) const {
  if (!account_id) {
    return std::string{kTreasuryName};
  }
  if (auto resolved = resolve_account(*account_id)) {
    return resolved->display_name;
  }
  return *account_id;
}

wallet_view engine::make_wallet_view(const account_id_t& account_id,
                                     const std::string& display_name) const {
  auto view = wallet_view{};
  view.account_id = account_id;
  view.display_name = display_name;
  if (auto wallet = wallets_.find(account_id)) {
    view.coin_balance = wallet->coin_balance;
    view.token_balance = wallet->token_balance;
    view.dividends_received = wallet->dividends_received;
  }
  view.token_percentage = percentage_of(
      view.token_balance, treasury_.state().total_token_supply);
  view.pending_dividends = dividends_.pending_for(view.token_balance);
  return view;
}

result<transaction_t> engine::transfer(const std::string_view& from_user_id,
                                       const std::string_view& to_account,
                                       const asset_type_t asset,
                                       const amount_t& amount,
                                       const std::string& description,
                                       const deadline_t& deadline) {
  auto sender = resolve_user(from_user_id);
  auto recipient = resolve_account(to_account);
  return run<transaction_t>(
      "transfer", deadline,
      [&](altyn::ledger::unit_of_work& work) -> result<transaction_t> {
        if (!sender) {
          return unknown_account<transaction_t>(from_user_id,
                                                kTransferCodespace);
        }
        if (!recipient) {
          return unknown_account<transaction_t>(to_account,
                                                kTransferCodespace);
        }
        if (asset == asset_type_t::token && !sender->is_admin) {
          return make_error<transaction_t>(
              ledger_error_code::unauthorized,
              "TOKEN transfers are restricted to administrators",
              kTransferCodespace);
        }
        return transfers_.transfer(
            work, transfer_request{.from_account = sender->user_id,
                                   .to_account = recipient->user_id,
                                   .asset = asset,
                                   .amount = amount,
                                   .type = transaction_type_t::transfer,
                                   .description = description.empty()
                                                      ? std::string{"Transfer"}
                                                      : description});
      });
}

result<transaction_t> engine::corporate_transfer(
    const std::string_view& actor_id,
    const std::string_view& organization_id,
    const std::string_view& to_account,
    const amount_t& amount,
    const std::string& description,
    const deadline_t& deadline) {
  auto actor = resolve_user(actor_id);
  auto recipient = resolve_account(to_account);
  return run<transaction_t>(
      "corporate transfer", deadline,
      [&](altyn::ledger::unit_of_work& work) -> result<transaction_t> {
        if (!actor) {
          return unknown_account<transaction_t>(actor_id, kTransferCodespace);
        }
        if (organization_id.empty() || !actor->operates(organization_id)) {
          return make_error<transaction_t>(
              ledger_error_code::unauthorized,
              fmt::format("{} does not operate organization '{}'", actor_id,
                          organization_id),
              kTransferCodespace);
        }
        if (!recipient) {
          return unknown_account<transaction_t>(to_account,
                                                kTransferCodespace);
        }
        return transfers_.transfer(
            work,
            transfer_request{
                .from_account = make_corporate_account(organization_id),
                .to_account = recipient->user_id,
                .asset = asset_type_t::coin,
                .amount = amount,
                .type = transaction_type_t::transfer,
                .description = description.empty()
                                   ? std::string{"Corporate transfer"}
                                   : description,
                .reference = actor->user_id});
      });
}

result<settlement> engine::pay(const std::string_view& buyer_id,
                               const std::string_view& seller_account,
                               const amount_t& amount,
                               const transaction_type_t payment_type,
                               const std::optional<std::string>& listing_id,
                               const std::string& description,
                               const deadline_t& deadline) {
  auto buyer = resolve_user(buyer_id);
  auto seller = resolve_account(seller_account);
  return run<settlement>(
      "payment", deadline,
      [&](altyn::ledger::unit_of_work& work) -> result<settlement> {
        if (!buyer) {
          return unknown_account<settlement>(buyer_id, kSettlementCodespace);
        }
        if (!seller) {
          return unknown_account<settlement>(seller_account,
                                             kSettlementCodespace);
        }
        return settlements_.pay(
            work, payment_request{.buyer = std::move(*buyer),
                                  .seller = std::move(*seller),
                                  .amount = amount,
                                  .type = payment_type,
                                  .listing_id = listing_id,
                                  .description = description});
      });
}

result<transaction_t> engine::emit(const std::string_view& admin_id,
                                   const std::string_view& target_account,
                                   const amount_t& amount,
                                   const std::string& description,
                                   const deadline_t& deadline) {
  auto admin = resolve_user(admin_id);
  auto target = resolve_account(target_account);
  return run<transaction_t>(
      "emission", deadline,
      [&](altyn::ledger::unit_of_work& work) -> result<transaction_t> {
        if (!admin) {
          return unknown_account<transaction_t>(admin_id, kEmissionCodespace);
        }
        if (!admin->is_admin) {
          return not_admin<transaction_t>(admin_id, kEmissionCodespace);
        }
        if (!target) {
          return unknown_account<transaction_t>(target_account,
                                                kEmissionCodespace);
        }
        return emissions_.emit(work, *admin, target->user_id, amount,
                               description);
      });
}

result<std::vector<transaction_t>> engine::issue_tokens(
    const std::string_view& admin_id,
    const std::string_view& target_account,
    const amount_t& token_amount,
    const amount_t& coin_amount,
    const deadline_t& deadline) {
  using issued_t = std::vector<transaction_t>;
  auto admin = resolve_user(admin_id);
  auto target = resolve_account(target_account);
  return run<issued_t>(
      "token issuance", deadline,
      [&](altyn::ledger::unit_of_work& work) -> result<issued_t> {
        if (!admin) {
          return unknown_account<issued_t>(admin_id, kEmissionCodespace);
        }
        if (!admin->is_admin) {
          return not_admin<issued_t>(admin_id, kEmissionCodespace);
        }
        if (!target) {
          return unknown_account<issued_t>(target_account, kEmissionCodespace);
        }
        return emissions_.issue_tokens(work, *admin, target->user_id,
                                       token_amount, coin_amount);
      });
}

result<dividend_payout_t> engine::distribute(const std::string_view& admin_id,
                                             const deadline_t& deadline) {
  auto admin = resolve_user(admin_id);
  return run<dividend_payout_t>(
      "dividend distribution", deadline,
      [&](altyn::ledger::unit_of_work& work) -> result<dividend_payout_t> {
        if (!admin) {
          return unknown_account<dividend_payout_t>(admin_id,
                                                    kDividendCodespace);
        }
        return dividends_.distribute(work, *admin);
      });
}

amount_t engine::get_balance(const std::string_view& account_id,
                             const asset_type_t asset) const {
  auto lock = std::scoped_lock{mutex_};
  return wallets_.get_balance(account_id, asset);
}

result<wallet_view> engine::get_wallet(const std::string_view& user_id) const {
  auto user = resolve_user(user_id);
  if (!user) {
    return unknown_account<wallet_view>(user_id, kQueryCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  return make_result(make_wallet_view(user->user_id, user->display_name));
}

result<wallet_view> engine::get_corporate_wallet(
    const std::string_view& actor_id,
    const std::string_view& organization_id) const {
  auto actor = resolve_user(actor_id);
  if (!actor) {
    return unknown_account<wallet_view>(actor_id, kQueryCodespace);
  }
  if (organization_id.empty() || !actor->operates(organization_id)) {
    return make_error<wallet_view>(
        ledger_error_code::unauthorized,
        fmt::format("{} does not operate organization '{}'", actor_id,
                    organization_id),
        kQueryCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  return make_result(make_wallet_view(make_corporate_account(organization_id),
                                      std::string{organization_id}));
}

result<portfolio> engine::get_portfolio(const std::string_view& user_id) const {
  auto user = resolve_user(user_id);
  if (!user) {
    return unknown_account<portfolio>(user_id, kQueryCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  auto view = make_wallet_view(user->user_id, user->display_name);

  auto out = portfolio{};
  out.account_id = view.account_id;
  out.coin_balance = view.coin_balance;
  out.token_balance = view.token_balance;
  out.token_percentage = view.token_percentage;
  out.dividends_received = view.dividends_received;
  out.pending_dividends = view.pending_dividends;
  out.rates = rates_.get_rates();
  for (const auto& [currency, rate] : out.rates) {
    out.coin_valuations.push_back(currency_value{
        .currency = currency, .value = multiply(view.coin_balance, rate)});
  }
  return make_result(std::move(out));
}

result<history_page> engine::get_transactions(const std::string_view& user_id,
                                              const std::size_t limit,
                                              const std::size_t offset) const {
  auto user = resolve_user(user_id);
  if (!user) {
    return unknown_account<history_page>(user_id, kQueryCodespace);
  }

  auto page = history_page{};
  auto transactions = std::vector<transaction_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    page.total = log_.count_for_account(user->user_id);
    transactions = log_.by_account(user->user_id,
                                   std::min(limit, kMaxHistoryPage), offset);
  }
  for (auto& tx : transactions) {
    auto entry = history_entry{};
    entry.from_name = display_name_of(tx.from_account);
    entry.to_name = display_name_of(tx.to_account);
    entry.is_incoming = tx.to_account == user->user_id;
    entry.transaction = std::move(tx);
    page.entries.push_back(std::move(entry));
  }
  return make_result(std::move(page));
}

token_holders engine::get_token_holders(const std::size_t limit) const {
  auto out = token_holders{};
  auto holders = std::vector<wallet_state_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    out.total_supply = treasury_.state().total_token_supply;
    holders = wallets_.token_holders();
  }
  out.holders_count = holders.size();
  if (limit != 0 && holders.size() > limit) {
    holders.resize(limit);
  }
  for (const auto& wallet : holders) {
    out.holders.push_back(token_holder{
        .account_id = wallet.account_id,
        .display_name = display_name_of(wallet.account_id),
        .token_balance = wallet.token_balance,
        .percentage = percentage_of(wallet.token_balance, out.total_supply)});
  }
  return out;
}

result<treasury_stats> engine::get_treasury_stats(
    const std::string_view& admin_id) const {
  auto admin = resolve_user(admin_id);
  if (!admin) {
    return unknown_account<treasury_stats>(admin_id, kQueryCodespace);
  }
  if (!admin->is_admin) {
    return not_admin<treasury_stats>(admin_id, kQueryCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  return make_result(treasury_stats{
      .treasury = treasury_.state(),
      .recent_emissions =
          log_.recent(transaction_type_t::emission, kRecentStatsLimit),
      .recent_dividends = log_.recent_payouts(kRecentStatsLimit)});
}

result<transaction_t> engine::get_transaction(
    const std::string_view& transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto tx = log_.get(transaction_id);
  if (!tx) {
    return make_error<transaction_t>(
        ledger_error_code::not_found,
        fmt::format("unknown transaction '{}'", transaction_id),
        kQueryCodespace);
  }
  return make_result(std::move(*tx));
}

result<receipt_t> engine::get_receipt(const std::string_view& receipt_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto receipt = log_.find_receipt(receipt_id);
  if (!receipt) {
    return make_error<receipt_t>(
        ledger_error_code::not_found,
        fmt::format("unknown receipt '{}'", receipt_id), kQueryCodespace);
  }
  return make_result(std::move(*receipt));
}

std::vector<exchange_rate> engine::get_rates() const {
  return rates_.get_rates();
}

result<amount_t> engine::convert(const amount_t& coin_amount,
                                 const std::string_view& currency) const {
  return rates_.convert(coin_amount, currency);
}

result<std::vector<exchange_rate>> engine::update_rates(
    const std::string_view& admin_id,
    const std::vector<exchange_rate>& rates) {
  auto admin = resolve_user(admin_id);
  if (!admin) {
    return unknown_account<std::vector<exchange_rate>>(admin_id,
                                                       kQueryCodespace);
  }
  if (!admin->is_admin) {
    return not_admin<std::vector<exchange_rate>>(admin_id, kQueryCodespace);
  }
  return rates_.update_rates(rates);
}

result<audit_report> engine::audit(const std::string_view& admin_id) const {
  auto admin = resolve_user(admin_id);
  if (!admin) {
    return unknown_account<audit_report>(admin_id, kQueryCodespace);
  }
  if (!admin->is_admin) {
    return not_admin<audit_report>(admin_id, kQueryCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  return make_result(altyn::ledger::audit_ledger(encoder_, storage_));
}

}  // namespace altyn::execution
