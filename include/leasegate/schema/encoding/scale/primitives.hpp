#pragma once
#include <leasegate/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <vector>

// 256-bit integers travel as 32 big-endian bytes. These helpers are used by
// every record that carries an amount or a field element.
namespace leasegate::schema {

void encode_amount(const amount_t& o, ::scale::Encoder& encoder);
void decode_amount(amount_t& o, ::scale::Decoder& decoder);

void encode_field_elements(const std::vector<field_element_t>& o,
                           ::scale::Encoder& encoder);
void decode_field_elements(std::vector<field_element_t>& o,
                           ::scale::Decoder& decoder);

}  // namespace leasegate::schema
