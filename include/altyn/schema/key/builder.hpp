#pragma once
#include <altyn/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace altyn::schema::key {

struct builder final {
  altyn::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Length-prefixed string, so variable-length ids cannot run into the
  /// next key component.
  builder& write_sized(const std::string_view& str);

  /// Big-endian so that RocksDB's bytewise order matches numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace altyn::schema::key
