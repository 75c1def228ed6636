#pragma once
#include <leasegate/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace leasegate::blake3 {

leasegate::schema::hash32_t hash(const std::string_view& str);
leasegate::schema::hash32_t hash(const leasegate::schema::bytes_view_t& bytes);

/// Hash `bytes` under a derive-key context so digests of different record
/// kinds never collide even when their encodings do.
leasegate::schema::hash32_t derive(const std::string_view& context,
                                   const leasegate::schema::bytes_view_t& bytes);

}  // namespace leasegate::blake3
