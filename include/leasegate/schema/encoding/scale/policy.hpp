#pragma once
#include <leasegate/schema/policy.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasegate::schema {

void encode(const policy_terms<1>& o, ::scale::Encoder& encoder);
void decode(policy_terms<1>& o, ::scale::Decoder& decoder);

void encode(const policy<1>& o, ::scale::Encoder& encoder);
void decode(policy<1>& o, ::scale::Decoder& decoder);

}  // namespace leasegate::schema
