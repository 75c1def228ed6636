#include <leasegate/common/critical.hpp>
#include <leasegate/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace leasegate::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    leasegate::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    leasegate::common::critical("make_hash32 expected 32 hex encoded bytes");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    leasegate::common::critical("invalid hex input");
  }
  return *decoded;
}

hash32_t to_be_bytes(const boost::multiprecision::uint256_t& value) {
  auto raw = bytes_t{};
  raw.reserve(32);
  boost::multiprecision::export_bits(value, std::back_inserter(raw), 8, true);
  auto out = hash32_t{};
  // export_bits drops leading zero bytes; right-align into the fixed buffer.
  std::copy(std::begin(raw), std::end(raw),
            std::begin(out) + static_cast<std::ptrdiff_t>(32 - raw.size()));
  return out;
}

boost::multiprecision::uint256_t from_be_bytes(const hash32_t& bytes) {
  auto value = boost::multiprecision::uint256_t{};
  boost::multiprecision::import_bits(value, std::begin(bytes), std::end(bytes),
                                     8, true);
  return value;
}

std::optional<amount_t> try_parse_amount(std::string_view decimal) {
  if (decimal.empty() || decimal.size() > 78) {
    return std::nullopt;
  }
  auto wide = boost::multiprecision::uint512_t{};
  for (const auto ch : decimal) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return std::nullopt;
    }
    wide = (wide * 10) + static_cast<unsigned>(ch - '0');
  }
  if (wide > boost::multiprecision::uint512_t{
                 std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return amount_t{wide};
}

std::optional<signer_id_t> try_parse_signer(std::string_view text) {
  constexpr auto kEd25519 = std::string_view{"ed25519:"};
  constexpr auto kSecp256k1 = std::string_view{"secp256k1:"};
  if (text.starts_with(kEd25519)) {
    text.remove_prefix(kEd25519.size());
    auto key = try_make_fixed<32>(text);
    if (!key) {
      return std::nullopt;
    }
    return signer_id_t{ed25519_signer_id{.public_key = *key}};
  }
  if (text.starts_with(kSecp256k1)) {
    text.remove_prefix(kSecp256k1.size());
    auto key = try_make_fixed<33>(text);
    if (!key) {
      return std::nullopt;
    }
    return signer_id_t{secp256k1_signer_id{.public_key = *key}};
  }
  return std::nullopt;
}

std::string to_string(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& value) {
                   return "ed25519:" +
                          to_hex(bytes_view_t{value.public_key.data(),
                                              value.public_key.size()});
                 },
                 [](const secp256k1_signer_id& value) {
                   return "secp256k1:" +
                          to_hex(bytes_view_t{value.public_key.data(),
                                              value.public_key.size()});
                 }},
      signer);
}

}  // namespace leasegate::schema
