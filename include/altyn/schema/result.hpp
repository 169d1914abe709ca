#pragma once

#include <altyn/schema/ledger_error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Outcome of a ledger operation: the value on success, otherwise an error
// code with a human-readable log line and the codespace that produced it.
namespace altyn::schema {

template <typename T>
struct result final {
  ledger_error_code code{ledger_error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == ledger_error_code::ok; }
};

template <typename T>
result<T> make_result(T value) {
  auto out = result<T>{};
  out.value = std::move(value);
  return out;
}

template <typename T>
result<T> make_error(const ledger_error_code code,
                     std::string log,
                     const std::string_view codespace) {
  auto out = result<T>{};
  out.code = code;
  out.log = std::move(log);
  out.codespace = std::string{codespace};
  return out;
}

/// Re-type a failed result, keeping its code, log and codespace.
template <typename T, typename U>
result<T> forward_error(const result<U>& failed) {
  return make_error<T>(failed.code, failed.log, failed.codespace);
}

}  // namespace altyn::schema
