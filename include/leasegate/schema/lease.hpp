#pragma once

#include <leasegate/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: lease.
// Rental workflow: escrowed rent for one (policy, tenant) pair. A lease leaves
// `active` exactly once, either released to the owner or refunded.
namespace leasegate::schema {

enum class lease_status_t : uint8_t {
  none = 0,
  active = 1,
  released = 2,
  refunded = 3
};

inline constexpr auto kLeaseStatusMappings = std::array{
    std::pair<std::string_view, lease_status_t>{"none", lease_status_t::none},
    std::pair<std::string_view, lease_status_t>{"active",
                                                lease_status_t::active},
    std::pair<std::string_view, lease_status_t>{"released",
                                                lease_status_t::released},
    std::pair<std::string_view, lease_status_t>{"refunded",
                                                lease_status_t::refunded}};

inline constexpr std::string_view to_string(const lease_status_t value) {
  for (const auto& [name, status] : kLeaseStatusMappings) {
    if (status == value) {
      return name;
    }
  }
  return "unknown";
}

template <uint16_t Version>
struct lease;

template <>
struct lease<1> final {
  uint16_t version{1};
  account_id_t tenant{};
  amount_t amount{};
  timestamp_seconds_t deadline{};
  bool active{};
  lease_status_t status{lease_status_t::none};
  timestamp_seconds_t started_at{};
};

using lease_t = lease<1>;

}  // namespace leasegate::schema
