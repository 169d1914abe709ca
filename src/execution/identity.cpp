#include <altyn/execution/identity.hpp>
#include <altyn/execution/static_directory.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace altyn::execution {

bool identity::operates(const std::string_view& organization_id) const {
  return std::ranges::find(organizations, organization_id) !=
         std::end(organizations);
}

void static_directory::add(identity_t entry) {
  auto user_id = entry.user_id;
  entries_.insert_or_assign(std::move(user_id), std::move(entry));
}

std::optional<identity_t> static_directory::find(
    const std::string_view& user_id) const {
  auto it = entries_.find(user_id);
  if (it == std::end(entries_)) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t static_directory::size() const {
  return entries_.size();
}

identity_resolver_t static_directory::resolver() const {
  auto snapshot = std::make_shared<const static_directory>(*this);
  return [snapshot](const std::string_view& user_id) {
    return snapshot->find(user_id);
  };
}

std::optional<identity_t> parse_directory_entry(const std::string_view& line) {
  auto text = std::string{line};
  auto fields = std::vector<std::string>{};
  boost::algorithm::split(fields, text, [](char c) { return c == ','; });
  for (auto& field : fields) {
    boost::algorithm::trim(field);
  }
  if (fields.size() < 3 || fields.size() > 4 || fields[0].empty() ||
      fields[1].empty()) {
    return std::nullopt;
  }
  if (fields[2] != "admin" && fields[2] != "user") {
    return std::nullopt;
  }

  auto entry = identity_t{};
  entry.user_id = fields[0];
  entry.display_name = fields[1];
  entry.is_admin = fields[2] == "admin";
  if (fields.size() == 4 && !fields[3].empty()) {
    boost::algorithm::split(entry.organizations, fields[3],
                            [](char c) { return c == ';'; });
    for (auto& organization : entry.organizations) {
      boost::algorithm::trim(organization);
    }
    std::erase_if(entry.organizations,
                  [](const auto& organization) { return organization.empty(); });
  }
  return entry;
}

}  // namespace altyn::execution
