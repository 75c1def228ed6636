#include <leasegate/schema/encoding/scale/primitives.hpp>

namespace leasegate::schema {

void encode_amount(const amount_t& o, ::scale::Encoder& encoder) {
  encode(to_be_bytes(o), encoder);
}

void decode_amount(amount_t& o, ::scale::Decoder& decoder) {
  auto raw = hash32_t{};
  decode(raw, decoder);
  o = from_be_bytes(raw);
}

void encode_field_elements(const std::vector<field_element_t>& o,
                           ::scale::Encoder& encoder) {
  auto raw = std::vector<hash32_t>{};
  raw.reserve(o.size());
  for (const auto& element : o) {
    raw.push_back(to_be_bytes(element));
  }
  encode(raw, encoder);
}

void decode_field_elements(std::vector<field_element_t>& o,
                           ::scale::Decoder& decoder) {
  auto raw = std::vector<hash32_t>{};
  decode(raw, decoder);
  o.clear();
  o.reserve(raw.size());
  for (const auto& element : raw) {
    o.push_back(from_be_bytes(element));
  }
}

}  // namespace leasegate::schema
