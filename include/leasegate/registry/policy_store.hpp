#pragma once

#include <leasegate/execution/operation_result.hpp>
#include <leasegate/schema/policy.hpp>
#include <leasegate/state/journal.hpp>

namespace leasegate::registry {

/// Owner published rental terms. Policies are append-only: ids are handed out
/// sequentially from 1 and a stored policy is never modified or removed.
class policy_store final {
 public:
  explicit policy_store(leasegate::state::journal& journal);

  /// Validate, hash and store `terms` on behalf of `ctx.caller`.
  ///
  /// Fails `invalid_deadline` when the deadline is not after `ctx.now` and
  /// `invalid_terms` when age, multiplier or rent is zero.
  leasegate::execution::operation_result<leasegate::schema::policy_id_t>
  create_policy(const leasegate::execution::call_context& ctx,
                const leasegate::schema::policy_terms_t& terms);

  leasegate::execution::operation_result<leasegate::schema::policy_t>
  get_policy(leasegate::schema::policy_id_t policy_id);

  bool is_owner(leasegate::schema::policy_id_t policy_id,
                const leasegate::schema::account_id_t& account);

  leasegate::schema::policy_id_t next_policy_id();
  uint64_t policy_count();

 private:
  leasegate::state::journal& journal_;
};

}  // namespace leasegate::registry
