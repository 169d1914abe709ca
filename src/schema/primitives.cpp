#include <altyn/schema/primitives.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iterator>
#include <string_view>

namespace altyn::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = "0123456789abcdef";
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto normalized = normalize_hex(hex);
  auto hash = hash32_t{};
  if (normalized.size() != hash.size() * 2) {
    return std::nullopt;
  }
  for (size_t i = 0; i < hash.size(); ++i) {
    auto high = hex_nibble(normalized[2 * i]);
    auto low = hex_nibble(normalized[(2 * i) + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string make_identifier() {
  thread_local auto generator = boost::uuids::random_generator{};
  return boost::uuids::to_string(generator());
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

std::string to_iso8601(const timestamp_milliseconds_t timestamp) {
  auto seconds = static_cast<std::time_t>(timestamp / 1000);
  auto calendar = std::tm{};
  gmtime_r(&seconds, &calendar);
  char buffer[32]{};
  auto written =
      std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &calendar);
  auto out = std::string{buffer, written};
  auto millis = std::to_string(timestamp % 1000);
  out.push_back('.');
  out.append(3 - millis.size(), '0');
  out.append(millis);
  out.push_back('Z');
  return out;
}

account_id_t make_corporate_account(const std::string_view& organization_id) {
  auto account = account_id_t{kCorporateAccountPrefix};
  account.append(organization_id);
  return account;
}

bool is_corporate_account(const std::string_view& account_id) {
  return account_id.starts_with(kCorporateAccountPrefix);
}

}  // namespace altyn::schema
