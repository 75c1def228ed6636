#pragma once
#include <leasegate/schema/lease.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace leasegate::schema {

void encode(const lease<1>& o, ::scale::Encoder& encoder);
void decode(lease<1>& o, ::scale::Decoder& decoder);

}  // namespace leasegate::schema
