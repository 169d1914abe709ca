#pragma once
#include <altyn/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace altyn::blake3 {

altyn::schema::hash32_t hash(const altyn::schema::bytes_view_t& bytes);

/// BLAKE3 over `previous || payload`; links one log entry to the next.
altyn::schema::hash32_t chain(const altyn::schema::hash32_t& previous,
                              const altyn::schema::bytes_view_t& payload);

}  // namespace altyn::blake3
