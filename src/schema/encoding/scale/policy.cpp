#include <leasegate/schema/encoding/scale/policy.hpp>
#include <leasegate/schema/encoding/scale/primitives.hpp>

namespace leasegate::schema {

void encode(const policy_terms<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.min_age, encoder);
  encode(o.income_multiplier, encoder);
  encode_amount(o.rent_amount, encoder);
  encode(o.require_clean_record, encoder);
  encode(o.deadline, encoder);
}

void decode(policy_terms<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.min_age, decoder);
  decode(o.income_multiplier, decoder);
  decode_amount(o.rent_amount, decoder);
  decode(o.require_clean_record, decoder);
  decode(o.deadline, decoder);
}

void encode(const policy<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.min_age, encoder);
  encode(o.income_multiplier, encoder);
  encode_amount(o.rent_amount, encoder);
  encode(o.require_clean_record, encoder);
  encode(o.deadline, encoder);
  encode(o.owner, encoder);
  encode(o.content_hash, encoder);
}

void decode(policy<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.min_age, decoder);
  decode(o.income_multiplier, decoder);
  decode_amount(o.rent_amount, decoder);
  decode(o.require_clean_record, decoder);
  decode(o.deadline, decoder);
  decode(o.owner, decoder);
  decode(o.content_hash, decoder);
}

}  // namespace leasegate::schema
