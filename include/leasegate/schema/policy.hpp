#pragma once

#include <leasegate/schema/primitives.hpp>
#include <cstdint>

// Schema type: policy.
// Rental workflow: immutable eligibility terms an owner publishes once. The
// content hash commits to every other field and is reproducible off-system.
namespace leasegate::schema {

/// Owner supplied terms; the input of policy creation.
template <uint16_t Version>
struct policy_terms;

template <>
struct policy_terms<1> final {
  uint16_t version{1};
  uint32_t min_age{};
  uint32_t income_multiplier{};
  amount_t rent_amount{};
  bool require_clean_record{};
  timestamp_seconds_t deadline{};
};

using policy_terms_t = policy_terms<1>;

template <uint16_t Version>
struct policy;

template <>
struct policy<1> final {
  uint16_t version{1};
  uint32_t min_age{};
  uint32_t income_multiplier{};
  amount_t rent_amount{};
  bool require_clean_record{};
  timestamp_seconds_t deadline{};
  account_id_t owner{};
  hash32_t content_hash{};
};

using policy_t = policy<1>;

/// Content hash over (min_age, income_multiplier, rent_amount,
/// require_clean_record, deadline, owner), in that order.
hash32_t compute_policy_hash(const policy_terms_t& terms,
                             const account_id_t& owner);

}  // namespace leasegate::schema
