#pragma once

#include <leasegate/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Rental workflow: signals emitted by successful state transitions
// (PolicyCreated, Eligible, LeaseStarted, LeaseReleased, LeaseRefunded,
// IssuerUpdated). Events of a failed transition are discarded with it.
namespace leasegate::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  /// Value of the first attribute named `key`, if any.
  std::optional<std::string> attribute(std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return entry.value;
      }
    }
    return std::nullopt;
  }
};

using transaction_event_t = transaction_event<1>;

namespace event_type {
inline constexpr auto kPolicyCreated = std::string_view{"policy_created"};
inline constexpr auto kEligible = std::string_view{"eligible"};
inline constexpr auto kLeaseStarted = std::string_view{"lease_started"};
inline constexpr auto kLeaseReleased = std::string_view{"lease_released"};
inline constexpr auto kLeaseRefunded = std::string_view{"lease_refunded"};
inline constexpr auto kIssuerUpdated = std::string_view{"issuer_updated"};
}  // namespace event_type

transaction_event_t make_policy_created_event(policy_id_t policy_id,
                                              const account_id_t& owner,
                                              const hash32_t& content_hash);

transaction_event_t make_eligible_event(const account_id_t& tenant,
                                        policy_id_t policy_id,
                                        const nullifier_t& nullifier);

transaction_event_t make_lease_started_event(policy_id_t policy_id,
                                             const account_id_t& tenant,
                                             const amount_t& amount,
                                             timestamp_seconds_t deadline);

transaction_event_t make_lease_released_event(policy_id_t policy_id,
                                              const account_id_t& tenant,
                                              const amount_t& amount);

transaction_event_t make_lease_refunded_event(policy_id_t policy_id,
                                              const account_id_t& tenant,
                                              const amount_t& amount);

transaction_event_t make_issuer_updated_event(const signer_id_t& previous,
                                              const signer_id_t& next);

}  // namespace leasegate::schema
