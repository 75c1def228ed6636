#pragma once

#include <leasegate/eligibility/attestation.hpp>
#include <leasegate/eligibility/proof_verifier.hpp>
#include <leasegate/execution/operation_result.hpp>
#include <leasegate/schema/eligibility_claim.hpp>
#include <leasegate/schema/policy.hpp>
#include <leasegate/state/journal.hpp>
#include <memory>
#include <string_view>

namespace leasegate::eligibility {

/// Decides whether a claim proves eligibility for a policy. One implementation
/// per verification mode; the gate that owns it does not know which.
class eligibility_verifier {
 public:
  virtual ~eligibility_verifier() = default;

  virtual std::string_view mode() const = 0;

  /// Checks that need no policy: claim kind and caller binding.
  virtual leasegate::execution::empty_result_t authorize(
      const leasegate::execution::call_context& ctx,
      const leasegate::schema::eligibility_claim_t& claim) = 0;

  /// Full check of `claim` against a live `policy`. Yields the nullifier to
  /// consume on success.
  virtual leasegate::execution::operation_result<leasegate::schema::nullifier_t>
  verify(const leasegate::execution::call_context& ctx,
         leasegate::schema::policy_id_t policy_id,
         const leasegate::schema::policy_t& policy,
         const leasegate::schema::eligibility_claim_t& claim) = 0;
};

/// Public inputs a proof for `policy_id` must commit to, nullifier limbs
/// excluded.
std::vector<leasegate::schema::field_element_t> canonical_public_inputs(
    leasegate::schema::policy_id_t policy_id,
    const leasegate::schema::policy_t& policy);

class proof_eligibility_verifier final : public eligibility_verifier {
 public:
  static constexpr auto kMode = std::string_view{"proof"};

  explicit proof_eligibility_verifier(std::unique_ptr<proof_verifier> verifier);

  std::string_view mode() const override { return kMode; }

  leasegate::execution::empty_result_t authorize(
      const leasegate::execution::call_context& ctx,
      const leasegate::schema::eligibility_claim_t& claim) override;

  leasegate::execution::operation_result<leasegate::schema::nullifier_t>
  verify(const leasegate::execution::call_context& ctx,
         leasegate::schema::policy_id_t policy_id,
         const leasegate::schema::policy_t& policy,
         const leasegate::schema::eligibility_claim_t& claim) override;

  proof_verifier& backend() { return *verifier_; }

 private:
  std::unique_ptr<proof_verifier> verifier_;
};

/// Trusts exactly one issuer key. The issuer lives in state so a rotation
/// commits or aborts with the transaction that made it.
class attestation_eligibility_verifier final : public eligibility_verifier {
 public:
  static constexpr auto kMode = std::string_view{"attestation"};

  attestation_eligibility_verifier(
      leasegate::state::journal& journal,
      leasegate::schema::signer_id_t initial_issuer,
      attestation_domain domain,
      leasegate::schema::account_id_t administrator);

  std::string_view mode() const override { return kMode; }

  leasegate::execution::empty_result_t authorize(
      const leasegate::execution::call_context& ctx,
      const leasegate::schema::eligibility_claim_t& claim) override;

  leasegate::execution::operation_result<leasegate::schema::nullifier_t>
  verify(const leasegate::execution::call_context& ctx,
         leasegate::schema::policy_id_t policy_id,
         const leasegate::schema::policy_t& policy,
         const leasegate::schema::eligibility_claim_t& claim) override;

  leasegate::schema::signer_id_t issuer();

  /// Rotate the trusted issuer. Administrator only.
  leasegate::execution::empty_result_t set_issuer(
      const leasegate::execution::call_context& ctx,
      const leasegate::schema::signer_id_t& next);

  const attestation_domain& domain() const { return domain_; }
  const leasegate::schema::account_id_t& administrator() const {
    return administrator_;
  }

 private:
  leasegate::state::journal& journal_;
  leasegate::schema::signer_id_t initial_issuer_;
  attestation_domain domain_;
  leasegate::schema::account_id_t administrator_;
};

}  // namespace leasegate::eligibility
