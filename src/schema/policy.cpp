#include <leasegate/blake3/hash.hpp>
#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/schema/policy.hpp>

#include <tuple>

namespace leasegate::schema {

namespace {
constexpr auto kPolicyHashContext = std::string_view{"leasegate.policy.v1"};
}

hash32_t compute_policy_hash(const policy_terms_t& terms,
                             const account_id_t& owner) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{terms.min_age, terms.income_multiplier,
                 to_be_bytes(terms.rent_amount), terms.require_clean_record,
                 terms.deadline, owner});
  return leasegate::blake3::derive(kPolicyHashContext,
                                   make_bytes_view(encoded));
}

}  // namespace leasegate::schema
