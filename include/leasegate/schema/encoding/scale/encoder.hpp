#pragma once
#include <leasegate/common/critical.hpp>
#include <leasegate/schema/encoding/encoder.hpp>
#include <leasegate/schema/encoding/scale/eligibility_claim.hpp>
#include <leasegate/schema/encoding/scale/lease.hpp>
#include <leasegate/schema/encoding/scale/policy.hpp>
#include <leasegate/schema/encoding/scale/primitives.hpp>
#include <leasegate/schema/encoding/scale/transaction.hpp>
#include <leasegate/schema/transaction_result.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace leasegate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  leasegate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, leasegate::schema::bytes_t& out);

  template <typename T>
  T decode(const leasegate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const leasegate::schema::bytes_view_t& bytes);
};

template <typename T>
leasegate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    leasegate::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        leasegate::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const leasegate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    leasegate::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const leasegate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace leasegate::schema::encoding
