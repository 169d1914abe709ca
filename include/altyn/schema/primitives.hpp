#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace altyn::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Opaque account identifier. Users are addressed by the id handed over by
/// the identity collaborator, corporate wallets by `org:<organization id>`.
using account_id_t = std::string;

/// Fixed-point quantity with kAmountDecimals fraction digits.
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Fresh random UUID in canonical text form.
std::string make_identifier();

timestamp_milliseconds_t now_milliseconds();
std::string to_iso8601(timestamp_milliseconds_t timestamp);

inline constexpr auto kCorporateAccountPrefix = std::string_view{"org:"};

account_id_t make_corporate_account(const std::string_view& organization_id);
bool is_corporate_account(const std::string_view& account_id);

}  // namespace altyn::schema
