#pragma once

#include <leasegate/schema/primitives.hpp>
#include <leasegate/state/journal.hpp>

namespace leasegate::registry {

/// (account, policy) pairs that passed a gate. Records are never cleared.
class eligibility_registry final {
 public:
  explicit eligibility_registry(leasegate::state::journal& journal);

  void record(const leasegate::schema::account_id_t& account,
              leasegate::schema::policy_id_t policy_id);

  bool is_eligible(const leasegate::schema::account_id_t& account,
                   leasegate::schema::policy_id_t policy_id) const;

 private:
  leasegate::state::journal& journal_;
};

}  // namespace leasegate::registry
