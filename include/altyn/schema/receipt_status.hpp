#pragma once

#include <altyn/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace altyn::schema {

enum class receipt_status_t : uint8_t { completed = 0, failed = 1 };

inline constexpr auto kReceiptStatusMappings =
    std::array{std::pair<std::string_view, receipt_status_t>{
                   "COMPLETED", receipt_status_t::completed},
               std::pair<std::string_view, receipt_status_t>{
                   "FAILED", receipt_status_t::failed}};

template <>
inline std::optional<receipt_status_t> try_from_string<receipt_status_t>(
    const std::string_view value) {
  return from_string(value, kReceiptStatusMappings);
}

inline constexpr std::string_view to_string(const receipt_status_t value) {
  return to_string(value, kReceiptStatusMappings).value_or("unknown");
}

}  // namespace altyn::schema
