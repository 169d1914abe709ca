#pragma once

#include <altyn/execution/identity.hpp>
#include <altyn/execution/static_directory.hpp>
#include <altyn/schema/amount.hpp>
#include <altyn/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace altyn::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Decimal literal to amount; throws on malformed test input.
inline altyn::schema::amount_t amount(const std::string_view text) {
  auto parsed = altyn::schema::parse_amount(text);
  if (!parsed) {
    throw std::invalid_argument{std::string{"bad test amount: "} +
                                std::string{text}};
  }
  return *parsed;
}

/// admin (operates acme), alice (operates acme), bob, carol, dave.
inline altyn::execution::static_directory make_directory() {
  auto directory = altyn::execution::static_directory{};
  directory.add({.user_id = "admin",
                 .display_name = "Ada Admin",
                 .is_admin = true,
                 .organizations = {"acme"}});
  directory.add({.user_id = "alice",
                 .display_name = "Alice",
                 .is_admin = false,
                 .organizations = {"acme"}});
  directory.add({.user_id = "bob", .display_name = "Bob"});
  directory.add({.user_id = "carol", .display_name = "Carol"});
  directory.add({.user_id = "dave", .display_name = "Dave"});
  return directory;
}

}  // namespace altyn::testing
