#pragma once

#include <leasegate/schema/primitives.hpp>
#include <leasegate/state/journal.hpp>

namespace leasegate::registry {

/// One namespace of spent nullifiers shared by every gate variant.
class nullifier_registry final {
 public:
  explicit nullifier_registry(leasegate::state::journal& journal);

  /// Mark `nullifier` used. False, with nothing written, if it already was.
  bool try_consume(const leasegate::schema::nullifier_t& nullifier);

  bool is_used(const leasegate::schema::nullifier_t& nullifier) const;

 private:
  leasegate::state::journal& journal_;
};

}  // namespace leasegate::registry
