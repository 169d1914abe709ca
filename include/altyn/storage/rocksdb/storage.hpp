#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <altyn/common/critical.hpp>
#include <altyn/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace altyn::storage {

namespace detail {

inline altyn::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline altyn::schema::bytes_view_t to_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const altyn::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

/// Smallest key greater than every key starting with `prefix`; empty when no
/// such key exists (prefix of all 0xFF bytes).
inline std::string prefix_successor(std::string prefix) {
  while (!prefix.empty()) {
    auto& last = reinterpret_cast<unsigned char&>(prefix.back());
    if (last != 0xFF) {
      ++last;
      return prefix;
    }
    prefix.pop_back();
  }
  return prefix;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const altyn::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const altyn::schema::bytes_view_t& key,
           const T& value);

  bool write(const write_batch& batch);
  std::vector<key_value_entry_t> list_by_prefix(
      const altyn::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_by_prefix_reverse(
      const altyn::schema::bytes_view_t& prefix,
      std::size_t limit,
      std::size_t offset) const;
  uint64_t count_by_prefix(const altyn::schema::bytes_view_t& prefix) const;

  template <typename Visitor>
  void scan_prefix(const altyn::schema::bytes_view_t& prefix,
                   Visitor&& visitor) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    open_mode mode);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const altyn::schema::bytes_view_t& key) const {
  if (!database) {
    altyn::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      altyn::common::critical("Failed to get value from RocksDB: {}",
                              status.ToString());
    }
  }
  return {encoder.template decode<T>(altyn::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const altyn::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    altyn::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(altyn::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    altyn::common::critical("Failed to put value into RocksDB: {}",
                            status.ToString());
  }
}

/// Visits entries under `prefix` in key order without materializing them.
/// The scan stops as soon as `visitor` returns false.
template <typename Visitor>
void storage<rocksdb_storage_tag>::scan_prefix(
    const altyn::schema::bytes_view_t& prefix,
    Visitor&& visitor) const {
  if (!database) {
    altyn::common::critical("RocksDB database is not initialized");
  }
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    if (!visitor(detail::to_view(iterator->key()),
                 detail::to_view(iterator->value()))) {
      return;
    }
  }
  if (!iterator->status().ok()) {
    altyn::common::critical("Failed to scan RocksDB: {}",
                            iterator->status().ToString());
  }
}

}  // namespace altyn::storage
