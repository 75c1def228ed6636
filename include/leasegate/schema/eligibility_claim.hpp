#pragma once

#include <leasegate/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

// Schema type: eligibility claim.
// Rental workflow: what a tenant presents to the gate. Either a succinct proof
// bound to the policy terms, or an issuer-signed attestation.
namespace leasegate::schema {

/// Positions inside a proof claim's public inputs.
enum class public_input_slot : std::size_t {
  min_age = 0,
  income_multiplier = 1,
  rent_amount = 2,
  require_clean_record = 3,
  policy_id = 4,
  nullifier_high = 5,
  nullifier_low = 6,
};

inline constexpr std::size_t kPublicInputCount = 7;

/// Bits of an attestation pass bitmask.
inline constexpr uint8_t kPassAge = 0x01;
inline constexpr uint8_t kPassIncome = 0x02;
inline constexpr uint8_t kPassCleanRecord = 0x04;
inline constexpr uint8_t kPassAll = kPassAge | kPassIncome | kPassCleanRecord;

template <uint16_t Version>
struct proof_claim;

template <>
struct proof_claim<1> final {
  uint16_t version{1};
  bytes_t proof;
  std::vector<field_element_t> public_inputs;
};

using proof_claim_t = proof_claim<1>;

template <uint16_t Version>
struct attestation_claim;

template <>
struct attestation_claim<1> final {
  uint16_t version{1};
  account_id_t wallet{};
  policy_id_t policy_id{};
  timestamp_seconds_t expiry{};
  nullifier_t nullifier{};
  uint8_t pass_bitmask{};
};

using attestation_claim_t = attestation_claim<1>;

template <uint16_t Version>
struct signed_attestation;

template <>
struct signed_attestation<1> final {
  uint16_t version{1};
  attestation_claim_t claim;
  signature_t signature;
};

using signed_attestation_t = signed_attestation<1>;

using eligibility_claim_t = std::variant<proof_claim_t, signed_attestation_t>;

}  // namespace leasegate::schema
