#include <leasegate/escrow/escrow.hpp>
#include <leasegate/schema/key/engine_keys.hpp>
#include <leasegate/schema/transaction_event.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace leasegate::escrow {

using leasegate::execution::forward_failure;
using leasegate::execution::make_failure;
using leasegate::execution::make_success;
using leasegate::schema::error_code;

// Held for the duration of one public operation when the guard is enabled.
class escrow::entry_lock final {
 public:
  explicit entry_lock(bool& entered) : entered_{entered} { entered_ = true; }
  ~entry_lock() { entered_ = false; }

  entry_lock(const entry_lock&) = delete;
  entry_lock& operator=(const entry_lock&) = delete;

 private:
  bool& entered_;
};

escrow::escrow(leasegate::state::journal& journal,
               leasegate::registry::policy_store& policies,
               leasegate::registry::eligibility_registry& eligibility,
               value_ledger& ledger,
               const bool reentrancy_guard)
    : journal_{journal},
      policies_{policies},
      eligibility_{eligibility},
      ledger_{ledger},
      reentrancy_guard_{reentrancy_guard} {}

leasegate::execution::operation_result<leasegate::schema::lease_t>
escrow::start_lease(const leasegate::execution::call_context& ctx,
                    const leasegate::schema::policy_id_t policy_id,
                    const leasegate::schema::amount_t& value) {
  using result_t = leasegate::schema::lease_t;
  if (reentrancy_guard_ && entered_) {
    return make_failure<result_t>(error_code::reentrancy,
                                  "escrow re-entered during start_lease");
  }
  auto lock = std::optional<entry_lock>{};
  if (reentrancy_guard_) {
    lock.emplace(entered_);
  }

  if (!eligibility_.is_eligible(ctx.caller, policy_id)) {
    return make_failure<result_t>(
        error_code::not_eligible,
        fmt::format("caller is not eligible for policy {}", policy_id));
  }
  auto policy = policies_.get_policy(policy_id);
  if (!policy.ok()) {
    return forward_failure<result_t>(policy);
  }
  if (ctx.now >= policy.value->deadline) {
    return make_failure<result_t>(
        error_code::policy_expired,
        fmt::format("policy {} closed at {}", policy_id,
                    policy.value->deadline));
  }
  if (value != policy.value->rent_amount) {
    return make_failure<result_t>(
        error_code::amount_mismatch,
        fmt::format("sent {} but rent is {}", value.str(),
                    policy.value->rent_amount.str()));
  }
  if (is_lease_active(policy_id, ctx.caller)) {
    return make_failure<result_t>(
        error_code::already_active,
        fmt::format("lease for policy {} is already active", policy_id));
  }
  if (ledger_.balance_of(ctx.caller) < value) {
    return make_failure<result_t>(
        error_code::insufficient_funds,
        fmt::format("balance {} cannot cover rent {}",
                    ledger_.balance_of(ctx.caller).str(), value.str()));
  }

  auto checkpoint = journal_.mark();
  auto lease = leasegate::schema::lease_t{
      .tenant = ctx.caller,
      .amount = value,
      .deadline = policy.value->deadline,
      .active = true,
      .status = leasegate::schema::lease_status_t::active,
      .started_at = ctx.now};
  store_lease(policy_id, lease);

  if (!ledger_.transfer(ctx.caller, custody_account(), value)) {
    journal_.revert_to(checkpoint);
    return make_failure<result_t>(error_code::transfer_failed,
                                  "could not move rent into custody");
  }

  journal_.emit(leasegate::schema::make_lease_started_event(
      policy_id, lease.tenant, lease.amount, lease.deadline));
  spdlog::info("Lease started for policy {} by {} ({})", policy_id,
               leasegate::schema::to_hex(lease.tenant), lease.amount.str());
  return make_success(std::move(lease));
}

leasegate::execution::operation_result<leasegate::schema::amount_t>
escrow::owner_confirm(const leasegate::execution::call_context& ctx,
                      const leasegate::schema::policy_id_t policy_id,
                      const leasegate::schema::account_id_t& tenant) {
  using result_t = leasegate::schema::amount_t;
  if (reentrancy_guard_ && entered_) {
    return make_failure<result_t>(error_code::reentrancy,
                                  "escrow re-entered during owner_confirm");
  }
  auto lock = std::optional<entry_lock>{};
  if (reentrancy_guard_) {
    lock.emplace(entered_);
  }

  auto policy = policies_.get_policy(policy_id);
  if (!policy.ok()) {
    return forward_failure<result_t>(policy);
  }
  if (policy.value->owner != ctx.caller) {
    return make_failure<result_t>(
        error_code::not_policy_owner,
        fmt::format("caller does not own policy {}", policy_id));
  }
  auto lease = get_lease(policy_id, tenant);
  if (!lease || !lease->active) {
    return make_failure<result_t>(
        error_code::not_active,
        fmt::format("no active lease for policy {} and tenant {}", policy_id,
                    leasegate::schema::to_hex(tenant)));
  }

  auto checkpoint = journal_.mark();
  lease->active = false;
  lease->status = leasegate::schema::lease_status_t::released;
  store_lease(policy_id, *lease);

  if (!ledger_.transfer(custody_account(), policy.value->owner,
                        lease->amount)) {
    journal_.revert_to(checkpoint);
    return make_failure<result_t>(error_code::transfer_failed,
                                  "could not release rent to owner");
  }

  journal_.emit(leasegate::schema::make_lease_released_event(
      policy_id, tenant, lease->amount));
  spdlog::info("Lease for policy {} released to owner ({})", policy_id,
               lease->amount.str());
  return make_success(lease->amount);
}

leasegate::execution::operation_result<leasegate::schema::amount_t>
escrow::timeout_refund(const leasegate::execution::call_context& ctx,
                       const leasegate::schema::policy_id_t policy_id) {
  using result_t = leasegate::schema::amount_t;
  if (reentrancy_guard_ && entered_) {
    return make_failure<result_t>(error_code::reentrancy,
                                  "escrow re-entered during timeout_refund");
  }
  auto lock = std::optional<entry_lock>{};
  if (reentrancy_guard_) {
    lock.emplace(entered_);
  }

  auto lease = get_lease(policy_id, ctx.caller);
  if (!lease || lease->tenant != ctx.caller) {
    return make_failure<result_t>(
        error_code::not_lease_tenant,
        fmt::format("caller holds no lease on policy {}", policy_id));
  }
  if (!lease->active) {
    return make_failure<result_t>(
        error_code::not_active,
        fmt::format("lease on policy {} is {}", policy_id,
                    leasegate::schema::to_string(lease->status)));
  }
  if (ctx.now < lease->deadline) {
    return make_failure<result_t>(
        error_code::too_early,
        fmt::format("refund opens at {}, now {}", lease->deadline, ctx.now));
  }

  auto checkpoint = journal_.mark();
  lease->active = false;
  lease->status = leasegate::schema::lease_status_t::refunded;
  store_lease(policy_id, *lease);

  if (!ledger_.transfer(custody_account(), lease->tenant, lease->amount)) {
    journal_.revert_to(checkpoint);
    return make_failure<result_t>(error_code::transfer_failed,
                                  "could not refund rent to tenant");
  }

  journal_.emit(leasegate::schema::make_lease_refunded_event(
      policy_id, lease->tenant, lease->amount));
  spdlog::info("Lease for policy {} refunded to {} ({})", policy_id,
               leasegate::schema::to_hex(lease->tenant), lease->amount.str());
  return make_success(lease->amount);
}

std::optional<leasegate::schema::lease_t> escrow::get_lease(
    const leasegate::schema::policy_id_t policy_id,
    const leasegate::schema::account_id_t& tenant) {
  return journal_.get<leasegate::schema::lease_t>(
      leasegate::schema::key::make_lease_key(journal_.encoder(), policy_id,
                                             tenant));
}

bool escrow::is_lease_active(const leasegate::schema::policy_id_t policy_id,
                             const leasegate::schema::account_id_t& tenant) {
  auto lease = get_lease(policy_id, tenant);
  return lease.has_value() && lease->active;
}

leasegate::schema::amount_t escrow::escrow_balance() {
  return ledger_.balance_of(custody_account());
}

void escrow::store_lease(const leasegate::schema::policy_id_t policy_id,
                         const leasegate::schema::lease_t& lease) {
  journal_.put(leasegate::schema::key::make_lease_key(journal_.encoder(),
                                                      policy_id, lease.tenant),
               lease);
}

}  // namespace leasegate::escrow
