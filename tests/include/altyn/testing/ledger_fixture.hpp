#pragma once

#include <gtest/gtest.h>

#include <altyn/execution/engine.hpp>
#include <altyn/testing/common.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace altyn::testing {

/// Engine over a throwaway database that can be closed and reopened.
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        identities_{make_directory().resolver()} {
    open();
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    engine_.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  altyn::execution::engine& engine() { return *engine_; }

  void open(const altyn::storage::open_mode mode =
                altyn::storage::open_mode::read_write) {
    engine_ = std::make_unique<altyn::execution::engine>(
        db_path_, identities_, altyn::execution::default_rates(), mode);
  }

  /// Release the database so a test can inspect or alter it directly.
  void close() { engine_.reset(); }

  void reopen(const altyn::storage::open_mode mode =
                  altyn::storage::open_mode::read_write) {
    close();
    open(mode);
  }

  /// Mint COIN to `account` through an admin emission.
  void fund(const std::string_view account, const std::string_view coins) {
    auto emitted = engine_->emit("admin", account, amount(coins), "funding");
    ASSERT_TRUE(emitted.ok()) << emitted.log;
  }

  /// Allocate TOKEN to `account` through an admin issuance.
  void grant_tokens(const std::string_view account,
                    const std::string_view tokens) {
    auto issued = engine_->issue_tokens("admin", account, amount(tokens),
                                        altyn::schema::amount_t{});
    ASSERT_TRUE(issued.ok()) << issued.log;
  }

  altyn::schema::amount_t coin(const std::string_view account) const {
    return engine_->get_balance(account, altyn::schema::asset_type_t::coin);
  }

  altyn::schema::treasury_state_t treasury() const {
    auto stats = engine_->get_treasury_stats("admin");
    EXPECT_TRUE(stats.ok()) << stats.log;
    return stats.value ? stats.value->treasury
                       : altyn::schema::treasury_state_t{};
  }

 private:
  std::string db_path_;
  altyn::execution::identity_resolver_t identities_;
  std::unique_ptr<altyn::execution::engine> engine_;
};

}  // namespace altyn::testing
