#pragma once
#include <leasegate/schema/primitives.hpp>
#include <optional>
#include <span>

namespace leasegate::schema::encoding {

// The codec is a build time choice: callers name the library tag once
// (`encoder<scale_encoder_tag>`) and never touch the library's own API.
template <typename Library>
struct encoder {
  template <typename T>
  leasegate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, leasegate::schema::bytes_t& out);

  template <typename T>
  T decode(const leasegate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const leasegate::schema::bytes_view_t& bytes);
};

}  // namespace leasegate::schema::encoding
