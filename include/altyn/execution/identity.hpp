#pragma once

#include <altyn/schema/primitives.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace altyn::execution {

/// A caller as described by the identity collaborator.
struct identity final {
  altyn::schema::account_id_t user_id;
  std::string display_name;
  bool is_admin{};
  /// Organizations whose corporate wallet this user may operate.
  std::vector<std::string> organizations;

  bool operates(const std::string_view& organization_id) const;
};

using identity_t = identity;

using identity_resolver_t =
    std::function<std::optional<identity_t>(const std::string_view& user_id)>;

}  // namespace altyn::execution
