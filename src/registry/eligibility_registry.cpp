#include <leasegate/registry/eligibility_registry.hpp>
#include <leasegate/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

namespace leasegate::registry {

namespace {
const auto kEligibleMarker = leasegate::schema::bytes_t{0x01};
}

eligibility_registry::eligibility_registry(leasegate::state::journal& journal)
    : journal_{journal} {}

void eligibility_registry::record(
    const leasegate::schema::account_id_t& account,
    const leasegate::schema::policy_id_t policy_id) {
  auto inserted = journal_.put_raw_if_absent(
      leasegate::schema::key::make_eligible_key(journal_.encoder(), account,
                                                policy_id),
      kEligibleMarker);
  if (!inserted) {
    spdlog::debug("Eligibility of {} for policy {} already recorded",
                  leasegate::schema::to_hex(account), policy_id);
  }
}

bool eligibility_registry::is_eligible(
    const leasegate::schema::account_id_t& account,
    const leasegate::schema::policy_id_t policy_id) const {
  auto encoder = leasegate::state::journal::encoder_t{};
  return journal_
      .get_raw(
          leasegate::schema::key::make_eligible_key(encoder, account, policy_id))
      .has_value();
}

}  // namespace leasegate::registry
