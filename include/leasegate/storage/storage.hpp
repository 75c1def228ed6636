#pragma once
#include <leasegate/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string_view>

namespace leasegate::storage {

/// Pending block writes, ordered by key so batches apply deterministically.
using write_set_t =
    std::map<leasegate::schema::bytes_t, leasegate::schema::bytes_t>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  leasegate::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<leasegate::schema::bytes_t> get_raw(
      const leasegate::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Apply a block's writes and its checkpoint in one atomic batch.
  void commit(const write_set_t& writes, const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace leasegate::storage
