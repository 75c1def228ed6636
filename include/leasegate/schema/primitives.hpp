#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace leasegate::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using nullifier_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using field_element_t = boost::multiprecision::uint256_t;
using policy_id_t = uint64_t;
using timestamp_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Big-endian 32 byte rendition of a 256-bit value.
hash32_t to_be_bytes(const boost::multiprecision::uint256_t& value);
boost::multiprecision::uint256_t from_be_bytes(const hash32_t& bytes);

std::optional<amount_t> try_parse_amount(std::string_view decimal);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;

  bool operator==(const ed25519_signer_id&) const = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;

  bool operator==(const secp256k1_signer_id&) const = default;
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// Parse "ed25519:<hex>" or "secp256k1:<hex>".
std::optional<signer_id_t> try_parse_signer(std::string_view text);
std::string to_string(const signer_id_t& signer);

}  // namespace leasegate::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
