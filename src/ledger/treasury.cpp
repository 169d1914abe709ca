#include <spdlog/spdlog.h>
#include <altyn/ledger/treasury.hpp>
#include <altyn/schema/amount.hpp>
#include <altyn/schema/key/ledger_keys.hpp>

using namespace altyn::schema;

namespace altyn::ledger {

treasury::treasury(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void treasury::load() {
  auto key = key::make_treasury_key();
  state_ = storage_.get<encoder_t, treasury_state_t>(encoder_,
                                                      make_bytes_view(key))
               .value_or(treasury_state_t{});
  spdlog::info("Treasury loaded: fees {}, circulation {}, token supply {}",
               format_amount(state_.collected_fees, kCoinDecimals),
               format_amount(state_.total_coins_in_circulation, kCoinDecimals),
               format_amount(state_.total_token_supply));
}

const treasury_state_t& treasury::state() const {
  return state_;
}

const treasury_state_t& treasury::staged_state(const unit_of_work& work) const {
  if (work.treasury) {
    return *work.treasury;
  }
  return state_;
}

treasury_state_t& treasury::staged(unit_of_work& work) {
  if (!work.treasury) {
    work.treasury = state_;
  }
  return *work.treasury;
}

void treasury::credit_fees(unit_of_work& work, const amount_t& fee) {
  if (fee == 0) {
    return;
  }
  auto& state = staged(work);
  state.collected_fees += fee;
  state.lifetime_fees += fee;
}

void treasury::mint(unit_of_work& work,
                    const asset_type_t asset,
                    const amount_t& amount) {
  auto& state = staged(work);
  if (asset == asset_type_t::coin) {
    state.total_coins_in_circulation += amount;
  } else {
    state.total_token_supply += amount;
  }
}

ledger_error_code treasury::drain_fees(unit_of_work& work,
                                       const amount_t& amount) {
  auto& state = staged(work);
  if (state.collected_fees < amount) {
    return ledger_error_code::insufficient_funds;
  }
  state.collected_fees -= amount;
  state.lifetime_dividends += amount;
  return ledger_error_code::ok;
}

void treasury::stage(const unit_of_work& work,
                     altyn::storage::write_batch& batch) {
  if (work.treasury) {
    batch.puts.emplace_back(key::make_treasury_key(),
                            encoder_.encode(*work.treasury));
  }
}

void treasury::apply(unit_of_work& work) {
  if (work.treasury) {
    state_ = *work.treasury;
  }
}

}  // namespace altyn::ledger
