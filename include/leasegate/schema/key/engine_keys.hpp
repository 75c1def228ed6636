#pragma once

#include <leasegate/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Rental workflow: canonical key prefixes and key codecs for policies,
// eligibility, nullifiers, leases and balances.
namespace leasegate::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kPolicyKeyPrefix{"SYS|STATE|POLICY|"};
inline constexpr std::string_view kPolicySeqKey{"SYS|STATE|POLICY_SEQ|"};
inline constexpr std::string_view kNullifierKeyPrefix{"SYS|STATE|NULLIFIER|"};
inline constexpr std::string_view kEligibleKeyPrefix{"SYS|STATE|ELIGIBLE|"};
inline constexpr std::string_view kLeaseKeyPrefix{"SYS|STATE|LEASE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kIssuerKey{"SYS|STATE|ISSUER|"};

inline constexpr std::array<std::string_view, 9> kEngineKeyspaces{
    kStatePrefix,         kNonceKeyPrefix,    kPolicyKeyPrefix,
    kPolicySeqKey,        kNullifierKeyPrefix, kEligibleKeyPrefix,
    kLeaseKeyPrefix,      kBalanceKeyPrefix,  kIssuerKey};

template <typename Encoder, typename T>
leasegate::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
leasegate::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
leasegate::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const leasegate::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
leasegate::schema::bytes_t make_policy_key(
    Encoder& encoder,
    const leasegate::schema::policy_id_t policy_id) {
  return make_prefixed_key(encoder, kPolicyKeyPrefix, policy_id);
}

template <typename Encoder>
leasegate::schema::bytes_t make_policy_seq_key(Encoder& encoder) {
  return make_prefix_key(encoder, kPolicySeqKey);
}

template <typename Encoder>
leasegate::schema::bytes_t make_nullifier_key(
    Encoder& encoder,
    const leasegate::schema::nullifier_t& nullifier) {
  return make_prefixed_key(encoder, kNullifierKeyPrefix, nullifier);
}

template <typename Encoder>
leasegate::schema::bytes_t make_eligible_key(
    Encoder& encoder,
    const leasegate::schema::account_id_t& account,
    const leasegate::schema::policy_id_t policy_id) {
  return make_prefixed_key(encoder, kEligibleKeyPrefix,
                           std::tuple{account, policy_id});
}

template <typename Encoder>
leasegate::schema::bytes_t make_lease_key(
    Encoder& encoder,
    const leasegate::schema::policy_id_t policy_id,
    const leasegate::schema::account_id_t& tenant) {
  return make_prefixed_key(encoder, kLeaseKeyPrefix,
                           std::tuple{policy_id, tenant});
}

template <typename Encoder>
leasegate::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const leasegate::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, account);
}

template <typename Encoder>
leasegate::schema::bytes_t make_issuer_key(Encoder& encoder) {
  return make_prefix_key(encoder, kIssuerKey);
}

}  // namespace leasegate::schema::key
