#pragma once

#include <leasegate/eligibility/eligibility_verifier.hpp>
#include <leasegate/execution/operation_result.hpp>
#include <leasegate/registry/eligibility_registry.hpp>
#include <leasegate/registry/nullifier_registry.hpp>
#include <leasegate/registry/policy_store.hpp>
#include <leasegate/schema/eligibility_claim.hpp>
#include <leasegate/state/journal.hpp>
#include <memory>

namespace leasegate::eligibility {

/// Admits tenants to policies. The verifier decides whether a claim is valid;
/// the gate owns the order of checks, replay protection and the record.
///
/// Gates built over the same registries share one nullifier namespace, so a
/// nullifier spent through either mode is spent for both.
class gate final {
 public:
  gate(leasegate::state::journal& journal,
       leasegate::registry::policy_store& policies,
       leasegate::registry::nullifier_registry& nullifiers,
       leasegate::registry::eligibility_registry& eligibility,
       std::unique_ptr<eligibility_verifier> verifier);

  /// On success the caller is eligible for `policy_id`, the claim's nullifier
  /// is spent and an `eligible` event is emitted. On failure nothing changes.
  leasegate::execution::operation_result<leasegate::schema::nullifier_t>
  submit(const leasegate::execution::call_context& ctx,
         leasegate::schema::policy_id_t policy_id,
         const leasegate::schema::eligibility_claim_t& claim);

  leasegate::execution::operation_result<leasegate::schema::nullifier_t>
  submit_proof(const leasegate::execution::call_context& ctx,
               leasegate::schema::policy_id_t policy_id,
               const leasegate::schema::proof_claim_t& claim);

  leasegate::execution::operation_result<leasegate::schema::nullifier_t>
  submit_attestation(const leasegate::execution::call_context& ctx,
                     const leasegate::schema::signed_attestation_t& attestation);

  bool is_eligible(const leasegate::schema::account_id_t& account,
                   leasegate::schema::policy_id_t policy_id) const;

  bool is_nullifier_used(const leasegate::schema::nullifier_t& nullifier) const;

  eligibility_verifier& verifier() { return *verifier_; }

 private:
  leasegate::state::journal& journal_;
  leasegate::registry::policy_store& policies_;
  leasegate::registry::nullifier_registry& nullifiers_;
  leasegate::registry::eligibility_registry& eligibility_;
  std::unique_ptr<eligibility_verifier> verifier_;
};

}  // namespace leasegate::eligibility
