#pragma once

#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/schema/primitives.hpp>
#include <leasegate/schema/transaction_event.hpp>
#include <leasegate/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace leasegate::state {

/// Position in the journal an operation can roll back to.
struct checkpoint final {
  std::size_t undo_depth{};
  std::size_t event_count{};
};

/// Uncommitted view of the state store for the block being executed.
///
/// Reads fall through the overlay to RocksDB. Every write records the value it
/// replaced so `revert_to` can undo an aborted operation, events included.
/// Nothing reaches disk until `persist`.
class journal final {
 public:
  using storage_t = leasegate::storage::rocksdb_storage_t;
  using encoder_t = leasegate::schema::encoding::scale_encoder_t;

  explicit journal(storage_t& storage);

  std::optional<leasegate::schema::bytes_t> get_raw(
      const leasegate::schema::bytes_t& key) const;
  void put_raw(const leasegate::schema::bytes_t& key,
               leasegate::schema::bytes_t value);

  /// Write only if the key is absent. Lookup and insert are one step.
  bool put_raw_if_absent(const leasegate::schema::bytes_t& key,
                         leasegate::schema::bytes_t value);

  template <typename T>
  std::optional<T> get(const leasegate::schema::bytes_t& key) {
    auto raw = get_raw(key);
    if (!raw) {
      return std::nullopt;
    }
    return encoder_.decode<T>(leasegate::schema::bytes_view_t{*raw});
  }

  template <typename T>
  void put(const leasegate::schema::bytes_t& key, const T& value) {
    put_raw(key, encoder_.encode(value));
  }

  encoder_t& encoder() { return encoder_; }

  void emit(leasegate::schema::transaction_event_t event);
  std::vector<leasegate::schema::transaction_event_t> events_since(
      const checkpoint& from) const;

  checkpoint mark() const;
  void revert_to(const checkpoint& to);

  const leasegate::storage::write_set_t& pending_writes() const;

  /// Write pending state and the checkpoint atomically, then reset.
  void persist(const leasegate::storage::committed_state& state);

  /// Drop everything not yet persisted.
  void discard();

 private:
  struct undo_entry final {
    leasegate::schema::bytes_t key;
    std::optional<leasegate::schema::bytes_t> previous;
  };

  storage_t& storage_;
  encoder_t encoder_{};
  leasegate::storage::write_set_t overlay_;
  std::vector<undo_entry> undo_;
  std::vector<leasegate::schema::transaction_event_t> events_;
};

}  // namespace leasegate::state
