#pragma once
#include <leasegate/schema/encoding/scale/eligibility_claim.hpp>
#include <leasegate/schema/encoding/scale/policy.hpp>
#include <leasegate/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasegate::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace leasegate::schema
