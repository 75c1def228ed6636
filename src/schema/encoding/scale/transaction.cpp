#include <leasegate/schema/encoding/scale/primitives.hpp>
#include <leasegate/schema/encoding/scale/transaction.hpp>

namespace leasegate::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode_amount(o.value, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode_amount(o.value, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace leasegate::schema
