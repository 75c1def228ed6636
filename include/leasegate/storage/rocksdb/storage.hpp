#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <leasegate/common/critical.hpp>
#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace leasegate::storage {

namespace detail {

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const leasegate::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<leasegate::schema::bytes_t> get_raw(
      const leasegate::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  void commit(const write_set_t& writes, const committed_state& state) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<leasegate::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const leasegate::schema::bytes_view_t& key) const {
  if (!database) {
    leasegate::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    leasegate::common::critical("Failed to get value from RocksDB");
  }
  return leasegate::schema::bytes_t{std::begin(value), std::end(value)};
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    leasegate::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    leasegate::common::critical("failed to load committed state");
  }

  auto encoder = leasegate::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, leasegate::schema::hash32_t>>(
          leasegate::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    leasegate::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_set_t& writes,
    const committed_state& state) const {
  if (!database) {
    leasegate::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      leasegate::common::critical("failed staging block write");
    }
  }

  auto encoder = leasegate::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = batch.Put(std::string{detail::kCommittedHeightKey},
                                detail::to_slice(encoded));
  if (!state_status.ok()) {
    leasegate::common::critical("failed staging committed height");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit block batch: {}", write_status.ToString());
    leasegate::common::critical("failed to commit block batch");
  }
}

}  // namespace leasegate::storage
