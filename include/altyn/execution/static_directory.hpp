#pragma once

#include <altyn/execution/identity.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace altyn::execution {

/// Fixed identity directory loaded from configuration.
class static_directory final {
 public:
  void add(identity_t entry);

  std::optional<identity_t> find(const std::string_view& user_id) const;

  std::size_t size() const;

  /// Resolver over a snapshot of the current entries.
  identity_resolver_t resolver() const;

 private:
  std::map<altyn::schema::account_id_t, identity_t, std::less<>> entries_;
};

/// Parse `id,Display Name,admin|user[,org1;org2]`.
std::optional<identity_t> parse_directory_entry(const std::string_view& line);

}  // namespace altyn::execution
