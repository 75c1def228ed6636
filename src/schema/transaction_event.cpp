#include <leasegate/schema/transaction_event.hpp>

#include <string>

namespace leasegate::schema {

namespace {

transaction_event_attribute_t indexed(std::string key, std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

transaction_event_attribute_t plain(std::string key, std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = false};
}

}  // namespace

transaction_event_t make_policy_created_event(const policy_id_t policy_id,
                                              const account_id_t& owner,
                                              const hash32_t& content_hash) {
  return transaction_event_t{
      .type = std::string{event_type::kPolicyCreated},
      .attributes = {indexed("policy_id", std::to_string(policy_id)),
                     indexed("owner", to_hex(owner)),
                     plain("content_hash", to_hex(content_hash))}};
}

transaction_event_t make_eligible_event(const account_id_t& tenant,
                                        const policy_id_t policy_id,
                                        const nullifier_t& nullifier) {
  return transaction_event_t{
      .type = std::string{event_type::kEligible},
      .attributes = {indexed("tenant", to_hex(tenant)),
                     indexed("policy_id", std::to_string(policy_id)),
                     plain("nullifier", to_hex(nullifier))}};
}

transaction_event_t make_lease_started_event(
    const policy_id_t policy_id,
    const account_id_t& tenant,
    const amount_t& amount,
    const timestamp_seconds_t deadline) {
  return transaction_event_t{
      .type = std::string{event_type::kLeaseStarted},
      .attributes = {indexed("policy_id", std::to_string(policy_id)),
                     indexed("tenant", to_hex(tenant)),
                     plain("amount", amount.str()),
                     plain("deadline", std::to_string(deadline))}};
}

transaction_event_t make_lease_released_event(const policy_id_t policy_id,
                                              const account_id_t& tenant,
                                              const amount_t& amount) {
  return transaction_event_t{
      .type = std::string{event_type::kLeaseReleased},
      .attributes = {indexed("policy_id", std::to_string(policy_id)),
                     indexed("tenant", to_hex(tenant)),
                     plain("amount", amount.str())}};
}

transaction_event_t make_lease_refunded_event(const policy_id_t policy_id,
                                              const account_id_t& tenant,
                                              const amount_t& amount) {
  return transaction_event_t{
      .type = std::string{event_type::kLeaseRefunded},
      .attributes = {indexed("policy_id", std::to_string(policy_id)),
                     indexed("tenant", to_hex(tenant)),
                     plain("amount", amount.str())}};
}

transaction_event_t make_issuer_updated_event(const signer_id_t& previous,
                                              const signer_id_t& next) {
  return transaction_event_t{
      .type = std::string{event_type::kIssuerUpdated},
      .attributes = {plain("previous", to_string(previous)),
                     plain("next", to_string(next))}};
}

}  // namespace leasegate::schema
