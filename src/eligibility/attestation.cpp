#include <leasegate/blake3/hash.hpp>
#include <leasegate/eligibility/attestation.hpp>
#include <leasegate/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace leasegate::eligibility {

namespace {
constexpr auto kDomainContext = std::string_view{"leasegate.domain.v1"};
constexpr auto kAttestationContext =
    std::string_view{"leasegate.attestation.v1"};
constexpr auto kGateContext = std::string_view{"leasegate.gate.v1"};
}  // namespace

leasegate::schema::hash32_t domain_separator(const attestation_domain& domain) {
  auto encoder = leasegate::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{domain.name, domain.version,
                                           domain.chain_id,
                                           domain.verifying_gate});
  return leasegate::blake3::derive(kDomainContext,
                                   leasegate::schema::make_bytes_view(encoded));
}

leasegate::schema::hash32_t attestation_digest(
    const attestation_domain& domain,
    const leasegate::schema::attestation_claim_t& claim) {
  auto encoder = leasegate::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{domain_separator(domain), claim.wallet, claim.policy_id,
                 claim.expiry, claim.nullifier, claim.pass_bitmask});
  return leasegate::blake3::derive(kAttestationContext,
                                   leasegate::schema::make_bytes_view(encoded));
}

leasegate::schema::hash32_t default_gate_id(
    const leasegate::schema::hash32_t& chain_id) {
  return leasegate::blake3::derive(
      kGateContext, leasegate::schema::bytes_view_t{chain_id.data(),
                                                    chain_id.size()});
}

leasegate::schema::nullifier_t nullifier_from_limbs(
    const leasegate::schema::field_element_t& high,
    const leasegate::schema::field_element_t& low) {
  return leasegate::schema::to_be_bytes((high << 128) | low);
}

}  // namespace leasegate::eligibility
