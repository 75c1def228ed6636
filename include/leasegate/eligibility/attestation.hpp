#pragma once

#include <leasegate/schema/eligibility_claim.hpp>
#include <leasegate/schema/primitives.hpp>
#include <string>

namespace leasegate::eligibility {

/// Binds an attestation signature to one deployment so it cannot be replayed
/// against another chain or gate.
struct attestation_domain final {
  std::string name{"leasegate.attestation"};
  std::string version{"1"};
  leasegate::schema::hash32_t chain_id{};
  leasegate::schema::hash32_t verifying_gate{};
};

leasegate::schema::hash32_t domain_separator(const attestation_domain& domain);

/// 32-byte digest the issuer signs for `claim` under `domain`.
leasegate::schema::hash32_t attestation_digest(
    const attestation_domain& domain,
    const leasegate::schema::attestation_claim_t& claim);

/// Default gate id for a chain when none is configured.
leasegate::schema::hash32_t default_gate_id(
    const leasegate::schema::hash32_t& chain_id);

/// Nullifier carried by a proof: (high << 128) | low, big-endian.
leasegate::schema::nullifier_t nullifier_from_limbs(
    const leasegate::schema::field_element_t& high,
    const leasegate::schema::field_element_t& low);

}  // namespace leasegate::eligibility
