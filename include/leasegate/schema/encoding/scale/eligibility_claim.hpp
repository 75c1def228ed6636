#pragma once
#include <leasegate/schema/eligibility_claim.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasegate::schema {

void encode(const proof_claim<1>& o, ::scale::Encoder& encoder);
void decode(proof_claim<1>& o, ::scale::Decoder& decoder);

}  // namespace leasegate::schema
