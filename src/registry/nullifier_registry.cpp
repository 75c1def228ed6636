#include <leasegate/registry/nullifier_registry.hpp>
#include <leasegate/schema/key/engine_keys.hpp>

namespace leasegate::registry {

namespace {
const auto kUsedMarker = leasegate::schema::bytes_t{0x01};
}

nullifier_registry::nullifier_registry(leasegate::state::journal& journal)
    : journal_{journal} {}

bool nullifier_registry::try_consume(
    const leasegate::schema::nullifier_t& nullifier) {
  return journal_.put_raw_if_absent(
      leasegate::schema::key::make_nullifier_key(journal_.encoder(),
                                                 nullifier),
      kUsedMarker);
}

bool nullifier_registry::is_used(
    const leasegate::schema::nullifier_t& nullifier) const {
  auto encoder = leasegate::state::journal::encoder_t{};
  return journal_
      .get_raw(leasegate::schema::key::make_nullifier_key(encoder, nullifier))
      .has_value();
}

}  // namespace leasegate::registry
