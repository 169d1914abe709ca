#pragma once

#include <altyn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: asset type.
// COIN is the USD-pegged settlement unit, TOKEN the equity unit that
// entitles holders to dividends.
namespace altyn::schema {

enum class asset_type_t : uint8_t { coin = 0, token = 1 };

inline constexpr auto kAssetTypeMappings = std::array{
    std::pair<std::string_view, asset_type_t>{"COIN", asset_type_t::coin},
    std::pair<std::string_view, asset_type_t>{"TOKEN", asset_type_t::token}};

template <>
inline std::optional<asset_type_t> try_from_string<asset_type_t>(
    const std::string_view value) {
  return from_string(value, kAssetTypeMappings);
}

inline constexpr std::string_view to_string(const asset_type_t value) {
  return to_string(value, kAssetTypeMappings).value_or("unknown");
}

}  // namespace altyn::schema
