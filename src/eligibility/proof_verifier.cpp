#include <leasegate/blake3/hash.hpp>
#include <leasegate/eligibility/proof_verifier.hpp>
#include <leasegate/schema/eligibility_claim.hpp>

#include <spdlog/spdlog.h>

namespace leasegate::eligibility {

unsafe_stub_proof_verifier::unsafe_stub_proof_verifier() {
  spdlog::warn(
      "{}: proof verification is disabled, every proof will be accepted",
      kName);
}

bool unsafe_stub_proof_verifier::verify(
    const leasegate::schema::bytes_view_t&,
    const std::vector<leasegate::schema::field_element_t>&) {
  return true;
}

backend_proof_verifier::backend_proof_verifier(
    leasegate::schema::bytes_t verification_key,
    proof_backend_t backend)
    : verification_key_{std::move(verification_key)},
      verification_key_id_{leasegate::blake3::hash(
          leasegate::schema::make_bytes_view(verification_key_))},
      backend_{std::move(backend)} {
  spdlog::info("Proof verifier bound to verification key {} ({} bytes)",
               leasegate::schema::to_hex(verification_key_id_),
               verification_key_.size());
  if (!backend_) {
    spdlog::warn("No proving backend installed; all proofs will be rejected");
  }
}

bool backend_proof_verifier::verify(
    const leasegate::schema::bytes_view_t& proof,
    const std::vector<leasegate::schema::field_element_t>& public_inputs) {
  if (!backend_) {
    spdlog::error("Proof rejected: no proving backend installed");
    return false;
  }
  if (proof.empty() || verification_key_.empty()) {
    return false;
  }
  if (public_inputs.size() != leasegate::schema::kPublicInputCount) {
    return false;
  }
  return backend_(leasegate::schema::make_bytes_view(verification_key_), proof,
                  public_inputs);
}

void backend_proof_verifier::set_backend(proof_backend_t backend) {
  backend_ = std::move(backend);
}

}  // namespace leasegate::eligibility
