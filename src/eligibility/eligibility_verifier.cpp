#include <leasegate/common/critical.hpp>
#include <leasegate/crypto/verify.hpp>
#include <leasegate/eligibility/eligibility_verifier.hpp>
#include <leasegate/schema/key/engine_keys.hpp>
#include <leasegate/schema/transaction_event.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace leasegate::eligibility {

using leasegate::execution::make_failure;
using leasegate::execution::make_success;
using leasegate::schema::error_code;
using leasegate::schema::public_input_slot;

namespace {

std::size_t slot(const public_input_slot value) {
  return static_cast<std::size_t>(value);
}

const auto kLimbBound = leasegate::schema::field_element_t{1} << 128;

}  // namespace

std::vector<leasegate::schema::field_element_t> canonical_public_inputs(
    const leasegate::schema::policy_id_t policy_id,
    const leasegate::schema::policy_t& policy) {
  return {leasegate::schema::field_element_t{policy.min_age},
          leasegate::schema::field_element_t{policy.income_multiplier},
          policy.rent_amount,
          leasegate::schema::field_element_t{
              policy.require_clean_record ? 1u : 0u},
          leasegate::schema::field_element_t{policy_id}};
}

proof_eligibility_verifier::proof_eligibility_verifier(
    std::unique_ptr<proof_verifier> verifier)
    : verifier_{std::move(verifier)} {
  if (!verifier_) {
    leasegate::common::critical("proof gate constructed without a verifier");
  }
  spdlog::info("Proof gate using verifier '{}'", verifier_->name());
}

leasegate::execution::empty_result_t proof_eligibility_verifier::authorize(
    const leasegate::execution::call_context&,
    const leasegate::schema::eligibility_claim_t& claim) {
  if (!std::holds_alternative<leasegate::schema::proof_claim_t>(claim)) {
    return make_failure(error_code::unsupported_claim,
                        "proof gate only accepts proof claims");
  }
  return make_success();
}

leasegate::execution::operation_result<leasegate::schema::nullifier_t>
proof_eligibility_verifier::verify(
    const leasegate::execution::call_context&,
    const leasegate::schema::policy_id_t policy_id,
    const leasegate::schema::policy_t& policy,
    const leasegate::schema::eligibility_claim_t& claim) {
  using result_t = leasegate::schema::nullifier_t;
  const auto* proof = std::get_if<leasegate::schema::proof_claim_t>(&claim);
  if (proof == nullptr) {
    return make_failure<result_t>(error_code::unsupported_claim,
                                  "proof gate only accepts proof claims");
  }

  const auto& inputs = proof->public_inputs;
  if (inputs.size() != leasegate::schema::kPublicInputCount) {
    return make_failure<result_t>(
        error_code::parameter_mismatch,
        fmt::format("expected {} public inputs, got {}",
                    leasegate::schema::kPublicInputCount, inputs.size()));
  }
  auto expected = canonical_public_inputs(policy_id, policy);
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (inputs[i] != expected[i]) {
      return make_failure<result_t>(
          error_code::parameter_mismatch,
          fmt::format("public input {} does not match policy {}", i,
                      policy_id));
    }
  }
  const auto& high = inputs[slot(public_input_slot::nullifier_high)];
  const auto& low = inputs[slot(public_input_slot::nullifier_low)];
  if (high >= kLimbBound || low >= kLimbBound) {
    return make_failure<result_t>(error_code::parameter_mismatch,
                                  "nullifier limb exceeds 128 bits");
  }

  if (!verifier_->verify(leasegate::schema::make_bytes_view(proof->proof),
                         inputs)) {
    return make_failure<result_t>(
        error_code::verification_failure,
        fmt::format("proof rejected by '{}'", verifier_->name()));
  }
  return make_success(nullifier_from_limbs(high, low));
}

attestation_eligibility_verifier::attestation_eligibility_verifier(
    leasegate::state::journal& journal,
    leasegate::schema::signer_id_t initial_issuer,
    attestation_domain domain,
    leasegate::schema::account_id_t administrator)
    : journal_{journal},
      initial_issuer_{std::move(initial_issuer)},
      domain_{std::move(domain)},
      administrator_{administrator} {
  spdlog::info("Attestation gate '{}' v{} trusting issuer {}", domain_.name,
               domain_.version, leasegate::schema::to_string(initial_issuer_));
}

leasegate::execution::empty_result_t
attestation_eligibility_verifier::authorize(
    const leasegate::execution::call_context& ctx,
    const leasegate::schema::eligibility_claim_t& claim) {
  const auto* signed_claim =
      std::get_if<leasegate::schema::signed_attestation_t>(&claim);
  if (signed_claim == nullptr) {
    return make_failure(error_code::unsupported_claim,
                        "attestation gate only accepts attestations");
  }
  if (signed_claim->claim.wallet != ctx.caller) {
    return make_failure(error_code::wallet_mismatch,
                        "attestation wallet is not the caller");
  }
  return make_success();
}

leasegate::execution::operation_result<leasegate::schema::nullifier_t>
attestation_eligibility_verifier::verify(
    const leasegate::execution::call_context& ctx,
    const leasegate::schema::policy_id_t,
    const leasegate::schema::policy_t&,
    const leasegate::schema::eligibility_claim_t& claim) {
  using result_t = leasegate::schema::nullifier_t;
  const auto* signed_claim =
      std::get_if<leasegate::schema::signed_attestation_t>(&claim);
  if (signed_claim == nullptr) {
    return make_failure<result_t>(error_code::unsupported_claim,
                                  "attestation gate only accepts attestations");
  }
  const auto& attestation = signed_claim->claim;

  if (attestation.expiry <= ctx.now) {
    return make_failure<result_t>(
        error_code::claim_expired,
        fmt::format("attestation expired at {}", attestation.expiry));
  }
  if (attestation.pass_bitmask != leasegate::schema::kPassAll) {
    return make_failure<result_t>(
        error_code::ineligible,
        fmt::format("pass bitmask {:#05b} does not meet every requirement",
                    attestation.pass_bitmask));
  }

  auto digest = attestation_digest(domain_, attestation);
  if (!leasegate::crypto::verify_signature(
          leasegate::schema::bytes_view_t{digest.data(), digest.size()},
          issuer(), signed_claim->signature)) {
    return make_failure<result_t>(error_code::invalid_signature,
                                  "attestation not signed by trusted issuer");
  }
  return make_success(attestation.nullifier);
}

leasegate::schema::signer_id_t attestation_eligibility_verifier::issuer() {
  auto stored = journal_.get<leasegate::schema::signer_id_t>(
      leasegate::schema::key::make_issuer_key(journal_.encoder()));
  return stored.value_or(initial_issuer_);
}

leasegate::execution::empty_result_t
attestation_eligibility_verifier::set_issuer(
    const leasegate::execution::call_context& ctx,
    const leasegate::schema::signer_id_t& next) {
  if (ctx.caller != administrator_) {
    return make_failure(error_code::not_gate_administrator,
                        "only the gate administrator may rotate the issuer");
  }
  auto previous = issuer();
  journal_.put(leasegate::schema::key::make_issuer_key(journal_.encoder()),
               next);
  journal_.emit(leasegate::schema::make_issuer_updated_event(previous, next));
  spdlog::info("Trusted issuer rotated from {} to {}",
               leasegate::schema::to_string(previous),
               leasegate::schema::to_string(next));
  return make_success();
}

}  // namespace leasegate::eligibility
