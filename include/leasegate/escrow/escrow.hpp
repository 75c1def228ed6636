#pragma once

#include <leasegate/escrow/value_ledger.hpp>
#include <leasegate/execution/operation_result.hpp>
#include <leasegate/registry/eligibility_registry.hpp>
#include <leasegate/registry/policy_store.hpp>
#include <leasegate/schema/lease.hpp>
#include <leasegate/state/journal.hpp>
#include <optional>

namespace leasegate::escrow {

/// Rent custody per (policy, tenant).
///
/// Every path updates the lease before value leaves custody, so a recipient
/// that calls back in sees the lease already closed. With `reentrancy_guard`
/// set, nested entry into any operation is also refused outright.
class escrow final {
 public:
  escrow(leasegate::state::journal& journal,
         leasegate::registry::policy_store& policies,
         leasegate::registry::eligibility_registry& eligibility,
         value_ledger& ledger,
         bool reentrancy_guard = true);

  /// Lock `value` from the caller as rent for `policy_id`. `value` must equal
  /// the policy rent exactly. A resolved lease may be started again.
  leasegate::execution::operation_result<leasegate::schema::lease_t>
  start_lease(const leasegate::execution::call_context& ctx,
              leasegate::schema::policy_id_t policy_id,
              const leasegate::schema::amount_t& value);

  /// Policy owner accepts the tenant; rent moves to the owner.
  leasegate::execution::operation_result<leasegate::schema::amount_t>
  owner_confirm(const leasegate::execution::call_context& ctx,
                leasegate::schema::policy_id_t policy_id,
                const leasegate::schema::account_id_t& tenant);

  /// Tenant reclaims rent once the deadline has passed (now >= deadline).
  leasegate::execution::operation_result<leasegate::schema::amount_t>
  timeout_refund(const leasegate::execution::call_context& ctx,
                 leasegate::schema::policy_id_t policy_id);

  std::optional<leasegate::schema::lease_t> get_lease(
      leasegate::schema::policy_id_t policy_id,
      const leasegate::schema::account_id_t& tenant);

  bool is_lease_active(leasegate::schema::policy_id_t policy_id,
                       const leasegate::schema::account_id_t& tenant);

  leasegate::schema::amount_t escrow_balance();

  bool reentrancy_guarded() const { return reentrancy_guard_; }

 private:
  class entry_lock;

  void store_lease(leasegate::schema::policy_id_t policy_id,
                   const leasegate::schema::lease_t& lease);

  leasegate::state::journal& journal_;
  leasegate::registry::policy_store& policies_;
  leasegate::registry::eligibility_registry& eligibility_;
  value_ledger& ledger_;
  bool reentrancy_guard_{true};
  bool entered_{false};
};

}  // namespace leasegate::escrow
