#pragma once

#include <leasegate/schema/eligibility_claim.hpp>
#include <leasegate/schema/policy.hpp>
#include <leasegate/schema/primitives.hpp>

#include <cstdint>
#include <variant>

// Schema type: transaction.
// Rental workflow: the signed envelope the host ledger orders. `value` is the
// native amount attached to the call; only start_lease accepts a non-zero one.
namespace leasegate::schema {

template <uint16_t Version>
struct create_policy;

template <>
struct create_policy<1> final {
  uint16_t version{1};
  policy_terms_t terms;
};

using create_policy_t = create_policy<1>;

template <uint16_t Version>
struct submit_proof;

template <>
struct submit_proof<1> final {
  uint16_t version{1};
  policy_id_t policy_id{};
  proof_claim_t claim;
};

using submit_proof_t = submit_proof<1>;

template <uint16_t Version>
struct submit_attestation;

template <>
struct submit_attestation<1> final {
  uint16_t version{1};
  signed_attestation_t attestation;
};

using submit_attestation_t = submit_attestation<1>;

template <uint16_t Version>
struct start_lease;

template <>
struct start_lease<1> final {
  uint16_t version{1};
  policy_id_t policy_id{};
};

using start_lease_t = start_lease<1>;

template <uint16_t Version>
struct owner_confirm;

template <>
struct owner_confirm<1> final {
  uint16_t version{1};
  policy_id_t policy_id{};
  account_id_t tenant{};
};

using owner_confirm_t = owner_confirm<1>;

template <uint16_t Version>
struct timeout_refund;

template <>
struct timeout_refund<1> final {
  uint16_t version{1};
  policy_id_t policy_id{};
};

using timeout_refund_t = timeout_refund<1>;

template <uint16_t Version>
struct set_issuer;

template <>
struct set_issuer<1> final {
  uint16_t version{1};
  signer_id_t issuer;
};

using set_issuer_t = set_issuer<1>;

using transaction_payload_t = std::variant<create_policy_t,
                                           submit_proof_t,
                                           submit_attestation_t,
                                           start_lease_t,
                                           owner_confirm_t,
                                           timeout_refund_t,
                                           set_issuer_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  amount_t value{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

/// Bytes covered by the envelope signature: every field but the signature.
bytes_t make_signing_payload(const transaction_t& tx);

}  // namespace leasegate::schema
