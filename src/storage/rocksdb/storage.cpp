#include <altyn/common/critical.hpp>
#include <altyn/storage/rocksdb/storage.hpp>

namespace altyn::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const open_mode mode) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      mode == open_mode::read_only
          ? ROCKSDB_NAMESPACE::DB::OpenForReadOnly(options, std::string{path},
                                                   &database)
          : ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    altyn::common::critical("Failed to open RocksDB at {}: {}", path,
                            status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}{}", path,
               mode == open_mode::read_only ? " (read-only)" : "");
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::write(const write_batch& batch) {
  if (!database) {
    altyn::common::critical("RocksDB database is not initialized");
  }
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.puts) {
    auto put_status =
        rocks_batch.Put(detail::to_slice(altyn::schema::make_bytes_view(key)),
                        detail::to_slice(altyn::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      spdlog::error("Failed staging key in write batch: {}",
                    put_status.ToString());
      return false;
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &rocks_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write batch of {} entries: {}",
                  batch.puts.size(), status.ToString());
    return false;
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const altyn::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  scan_prefix(prefix, [&](const altyn::schema::bytes_view_t& key,
                          const altyn::schema::bytes_view_t& value) {
    entries.emplace_back(altyn::schema::make_bytes(key),
                         altyn::schema::make_bytes(value));
    return true;
  });
  return entries;
}

std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix_reverse(
    const altyn::schema::bytes_view_t& prefix,
    const std::size_t limit,
    const std::size_t offset) const {
  if (!database) {
    altyn::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  if (limit == 0) {
    return entries;
  }
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto upper = detail::prefix_successor(prefix_string);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  if (upper.empty()) {
    iterator->SeekToLast();
  } else {
    iterator->SeekForPrev(upper);
  }

  auto skipped = std::size_t{0};
  while (iterator->Valid() && entries.size() < limit) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (key_view == upper) {
      iterator->Prev();
      continue;
    }
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    if (skipped < offset) {
      ++skipped;
    } else {
      entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                          detail::to_bytes(iterator->value())});
    }
    iterator->Prev();
  }
  return entries;
}

uint64_t storage<rocksdb_storage_tag>::count_by_prefix(
    const altyn::schema::bytes_view_t& prefix) const {
  auto count = uint64_t{0};
  scan_prefix(prefix, [&](const altyn::schema::bytes_view_t&,
                          const altyn::schema::bytes_view_t&) {
    ++count;
    return true;
  });
  return count;
}

}  // namespace altyn::storage
