#include <leasegate/schema/encoding/scale/eligibility_claim.hpp>
#include <leasegate/schema/encoding/scale/primitives.hpp>

namespace leasegate::schema {

void encode(const proof_claim<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proof, encoder);
  encode_field_elements(o.public_inputs, encoder);
}

void decode(proof_claim<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proof, decoder);
  decode_field_elements(o.public_inputs, decoder);
}

}  // namespace leasegate::schema
