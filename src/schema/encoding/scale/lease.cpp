#include <leasegate/schema/encoding/scale/lease.hpp>
#include <leasegate/schema/encoding/scale/primitives.hpp>

namespace leasegate::schema {

void encode(const lease<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.tenant, encoder);
  encode_amount(o.amount, encoder);
  encode(o.deadline, encoder);
  encode(o.active, encoder);
  encode(static_cast<uint8_t>(o.status), encoder);
  encode(o.started_at, encoder);
}

void decode(lease<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.tenant, decoder);
  decode_amount(o.amount, decoder);
  decode(o.deadline, decoder);
  decode(o.active, decoder);
  auto status = uint8_t{};
  decode(status, decoder);
  o.status = static_cast<lease_status_t>(status);
  decode(o.started_at, decoder);
}

}  // namespace leasegate::schema
