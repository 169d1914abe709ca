#pragma once
#include <altyn/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace altyn::storage {

using key_value_entry_t =
    std::pair<altyn::schema::bytes_t, altyn::schema::bytes_t>;

/// How a backend opens its files. A read-only backend rejects every write.
enum class open_mode : uint8_t { read_write, read_only };

/// Set of puts committed as one atomic unit.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const altyn::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const altyn::schema::bytes_view_t& key,
           const T& value);

  /// Commit every entry of the batch or none of them.
  bool write(const write_batch& batch);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const altyn::schema::bytes_view_t& prefix) const;

  /// Page through a prefix from the last key backwards.
  std::vector<key_value_entry_t> list_by_prefix_reverse(
      const altyn::schema::bytes_view_t& prefix,
      std::size_t limit,
      std::size_t offset) const;

  /// Number of keys under prefix.
  uint64_t count_by_prefix(const altyn::schema::bytes_view_t& prefix) const;

  /// Visit key-value pairs under prefix in key order until visitor returns
  /// false.
  template <typename Visitor>
  void scan_prefix(const altyn::schema::bytes_view_t& prefix,
                   Visitor&& visitor) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              open_mode mode = open_mode::read_write);

}  // namespace altyn::storage
