#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <altyn/execution/config.hpp>
#include <altyn/schema/amount.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>

using namespace altyn::schema;

namespace {

constexpr auto kRatePrefix = std::string_view{"rates."};
constexpr auto kUserKey = std::string_view{"user"};

void set_rate(std::vector<exchange_rate>& rates,
              const std::string& currency,
              const amount_t& rate) {
  auto it = std::ranges::find_if(
      rates, [&](const auto& entry) { return entry.currency == currency; });
  if (it != std::end(rates)) {
    it->rate = rate;
  } else {
    rates.push_back(exchange_rate{.currency = currency, .rate = rate});
  }
}

}  // namespace

namespace altyn::execution {

ledger_config parse_ledger_config(std::istream& input) {
  auto description = boost::program_options::options_description{"Ledger"};
  description.add_options()(
      "user", boost::program_options::value<std::vector<std::string>>(),
      "Directory entry: id,Display Name,admin|user[,org1;org2]");
  auto parsed =
      boost::program_options::parse_config_file(input, description, true);

  auto config = ledger_config{};
  for (const auto& option : parsed.options) {
    const auto& key = option.string_key;
    for (const auto& value : option.value) {
      if (key == kUserKey) {
        auto entry = parse_directory_entry(value);
        if (!entry) {
          throw std::runtime_error{
              fmt::format("malformed directory entry '{}'", value)};
        }
        config.directory.add(std::move(*entry));
      } else if (key.starts_with(kRatePrefix)) {
        auto currency = key.substr(kRatePrefix.size());
        auto rate = parse_amount(value);
        if (currency.empty() || !rate || *rate == 0) {
          throw std::runtime_error{
              fmt::format("malformed exchange rate '{} = {}'", key, value)};
        }
        if (currency == kPegCurrency) {
          spdlog::warn("Ignoring configured USD rate; the peg is fixed at 1.0");
          continue;
        }
        set_rate(config.rates, currency, *rate);
      } else {
        spdlog::warn("Ignoring unknown configuration key '{}'", key);
      }
    }
  }
  return config;
}

ledger_config load_ledger_config(const std::string& path) {
  auto input = std::ifstream{path};
  if (!input.good()) {
    throw std::runtime_error{
        fmt::format("cannot open configuration file '{}'", path)};
  }
  auto config = parse_ledger_config(input);
  spdlog::info("Loaded configuration '{}': {} rate(s), {} directory entr{}",
               path, config.rates.size(), config.directory.size(),
               config.directory.size() == 1 ? "y" : "ies");
  return config;
}

}  // namespace altyn::execution
