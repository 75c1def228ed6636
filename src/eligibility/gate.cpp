#include <leasegate/common/critical.hpp>
#include <leasegate/eligibility/gate.hpp>
#include <leasegate/schema/transaction_event.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace leasegate::eligibility {

using leasegate::execution::forward_failure;
using leasegate::execution::make_failure;
using leasegate::execution::make_success;
using leasegate::schema::error_code;

gate::gate(leasegate::state::journal& journal,
           leasegate::registry::policy_store& policies,
           leasegate::registry::nullifier_registry& nullifiers,
           leasegate::registry::eligibility_registry& eligibility,
           std::unique_ptr<eligibility_verifier> verifier)
    : journal_{journal},
      policies_{policies},
      nullifiers_{nullifiers},
      eligibility_{eligibility},
      verifier_{std::move(verifier)} {
  if (!verifier_) {
    leasegate::common::critical("eligibility gate requires a verifier");
  }
}

leasegate::execution::operation_result<leasegate::schema::nullifier_t>
gate::submit(const leasegate::execution::call_context& ctx,
             const leasegate::schema::policy_id_t policy_id,
             const leasegate::schema::eligibility_claim_t& claim) {
  using result_t = leasegate::schema::nullifier_t;

  auto authorized = verifier_->authorize(ctx, claim);
  if (!authorized.ok()) {
    return forward_failure<result_t>(authorized);
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

  auto verified = verifier_->verify(ctx, policy_id, *policy.value, claim);
  if (!verified.ok()) {
    spdlog::debug("{} claim for policy {} rejected: {}", verifier_->mode(),
                  policy_id, verified.message);
    return verified;
  }

  const auto& nullifier = *verified.value;
  if (!nullifiers_.try_consume(nullifier)) {
    return make_failure<result_t>(
        error_code::replay, fmt::format("nullifier {} already used",
                                        leasegate::schema::to_hex(nullifier)));
  }

  eligibility_.record(ctx.caller, policy_id);
  journal_.emit(
      leasegate::schema::make_eligible_event(ctx.caller, policy_id, nullifier));
  spdlog::info("Account {} eligible for policy {} via {}",
               leasegate::schema::to_hex(ctx.caller), policy_id,
               verifier_->mode());
  return verified;
}

leasegate::execution::operation_result<leasegate::schema::nullifier_t>
gate::submit_proof(const leasegate::execution::call_context& ctx,
                   const leasegate::schema::policy_id_t policy_id,
                   const leasegate::schema::proof_claim_t& claim) {
  return submit(ctx, policy_id, leasegate::schema::eligibility_claim_t{claim});
}

leasegate::execution::operation_result<leasegate::schema::nullifier_t>
gate::submit_attestation(
    const leasegate::execution::call_context& ctx,
    const leasegate::schema::signed_attestation_t& attestation) {
  return submit(ctx, attestation.claim.policy_id,
                leasegate::schema::eligibility_claim_t{attestation});
}

bool gate::is_eligible(const leasegate::schema::account_id_t& account,
                       const leasegate::schema::policy_id_t policy_id) const {
  return eligibility_.is_eligible(account, policy_id);
}

bool gate::is_nullifier_used(
    const leasegate::schema::nullifier_t& nullifier) const {
  return nullifiers_.is_used(nullifier);
}

}  // namespace leasegate::eligibility
