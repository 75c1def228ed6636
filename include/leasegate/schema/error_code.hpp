#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Failure reasons surfaced by every state transition. Codes are stable and
// leave the wire; never renumber.
namespace leasegate::schema {

enum class error_code : uint32_t {
  ok = 0,

  // Transaction envelope.
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  unexpected_value = 6,
  insufficient_funds = 7,
  invalid_query = 8,
  unknown_query_path = 9,

  // Policy store.
  invalid_deadline = 10,
  invalid_terms = 11,
  policy_not_found = 12,
  lease_not_found = 13,

  // Eligibility gate.
  policy_expired = 20,
  parameter_mismatch = 21,
  verification_failure = 22,
  replay = 23,
  wallet_mismatch = 24,
  claim_expired = 25,
  ineligible = 26,
  invalid_signature = 27,
  unsupported_claim = 28,
  not_gate_administrator = 29,

  // Escrow.
  not_eligible = 40,
  amount_mismatch = 41,
  already_active = 42,
  not_policy_owner = 43,
  not_lease_tenant = 44,
  not_active = 45,
  too_early = 46,
  transfer_failed = 47,
  reentrancy = 48,

  // Block.
  invalid_block_height = 50,
};

/// Coarse taxonomy a caller can branch on without knowing every code.
enum class error_category : uint8_t {
  none = 0,
  validation = 1,
  authorization = 2,
  replay = 3,
  expiry = 4,
  verification = 5,
  ineligible = 6,
  reentrancy = 7,
  not_found = 8,
  transfer = 9,
};

constexpr error_category category_of(const error_code code) {
  using enum error_code;
  switch (code) {
    case ok:
      return error_category::none;
    case invalid_transaction:
    case invalid_query:
    case unknown_query_path:
    case unsupported_transaction_version:
    case invalid_chain_id:
    case invalid_nonce:
    case unexpected_value:
    case invalid_deadline:
    case invalid_terms:
    case parameter_mismatch:
    case unsupported_claim:
    case amount_mismatch:
    case already_active:
    case not_active:
    case too_early:
    case invalid_block_height:
      return error_category::validation;
    case wallet_mismatch:
    case not_gate_administrator:
    case not_eligible:
    case not_policy_owner:
    case not_lease_tenant:
      return error_category::authorization;
    case replay:
      return error_category::replay;
    case policy_expired:
    case claim_expired:
      return error_category::expiry;
    case signature_verification_failed:
    case verification_failure:
    case invalid_signature:
      return error_category::verification;
    case ineligible:
      return error_category::ineligible;
    case reentrancy:
      return error_category::reentrancy;
    case policy_not_found:
    case lease_not_found:
      return error_category::not_found;
    case insufficient_funds:
    case transfer_failed:
      return error_category::transfer;
  }
  return error_category::validation;
}

inline constexpr auto kErrorCodeNames =
    std::array{std::pair<std::string_view, error_code>{"ok", error_code::ok},
               std::pair<std::string_view, error_code>{
                   "invalid_transaction", error_code::invalid_transaction},
               std::pair<std::string_view, error_code>{
                   "unsupported_transaction_version",
                   error_code::unsupported_transaction_version},
               std::pair<std::string_view, error_code>{
                   "invalid_chain_id", error_code::invalid_chain_id},
               std::pair<std::string_view, error_code>{
                   "invalid_nonce", error_code::invalid_nonce},
               std::pair<std::string_view, error_code>{
                   "signature_verification_failed",
                   error_code::signature_verification_failed},
               std::pair<std::string_view, error_code>{
                   "unexpected_value", error_code::unexpected_value},
               std::pair<std::string_view, error_code>{
                   "insufficient_funds", error_code::insufficient_funds},
               std::pair<std::string_view, error_code>{
                   "invalid_query", error_code::invalid_query},
               std::pair<std::string_view, error_code>{
                   "unknown_query_path", error_code::unknown_query_path},
               std::pair<std::string_view, error_code>{
                   "invalid_deadline", error_code::invalid_deadline},
               std::pair<std::string_view, error_code>{
                   "invalid_terms", error_code::invalid_terms},
               std::pair<std::string_view, error_code>{
                   "policy_not_found", error_code::policy_not_found},
               std::pair<std::string_view, error_code>{
                   "lease_not_found", error_code::lease_not_found},
               std::pair<std::string_view, error_code>{
                   "policy_expired", error_code::policy_expired},
               std::pair<std::string_view, error_code>{
                   "parameter_mismatch", error_code::parameter_mismatch},
               std::pair<std::string_view, error_code>{
                   "verification_failure", error_code::verification_failure},
               std::pair<std::string_view, error_code>{"replay",
                                                       error_code::replay},
               std::pair<std::string_view, error_code>{
                   "wallet_mismatch", error_code::wallet_mismatch},
               std::pair<std::string_view, error_code>{
                   "claim_expired", error_code::claim_expired},
               std::pair<std::string_view, error_code>{"ineligible",
                                                       error_code::ineligible},
               std::pair<std::string_view, error_code>{
                   "invalid_signature", error_code::invalid_signature},
               std::pair<std::string_view, error_code>{
                   "unsupported_claim", error_code::unsupported_claim},
               std::pair<std::string_view, error_code>{
                   "not_gate_administrator",
                   error_code::not_gate_administrator},
               std::pair<std::string_view, error_code>{
                   "not_eligible", error_code::not_eligible},
               std::pair<std::string_view, error_code>{
                   "amount_mismatch", error_code::amount_mismatch},
               std::pair<std::string_view, error_code>{
                   "already_active", error_code::already_active},
               std::pair<std::string_view, error_code>{
                   "not_policy_owner", error_code::not_policy_owner},
               std::pair<std::string_view, error_code>{
                   "not_lease_tenant", error_code::not_lease_tenant},
               std::pair<std::string_view, error_code>{"not_active",
                                                       error_code::not_active},
               std::pair<std::string_view, error_code>{"too_early",
                                                       error_code::too_early},
               std::pair<std::string_view, error_code>{
                   "transfer_failed", error_code::transfer_failed},
               std::pair<std::string_view, error_code>{
                   "reentrancy", error_code::reentrancy},
               std::pair<std::string_view, error_code>{
                   "invalid_block_height", error_code::invalid_block_height}};

constexpr std::string_view to_string(const error_code value) {
  for (const auto& [name, code] : kErrorCodeNames) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

constexpr std::optional<error_code> try_error_code_from_string(
    const std::string_view value) {
  for (const auto& [name, code] : kErrorCodeNames) {
    if (name == value) {
      return code;
    }
  }
  return std::nullopt;
}

constexpr std::string_view to_string(const error_category value) {
  using enum error_category;
  switch (value) {
    case none:
      return "none";
    case validation:
      return "validation";
    case authorization:
      return "authorization";
    case replay:
      return "replay";
    case expiry:
      return "expiry";
    case verification:
      return "verification";
    case ineligible:
      return "ineligible";
    case reentrancy:
      return "reentrancy";
    case not_found:
      return "not_found";
    case transfer:
      return "transfer";
  }
  return "unknown";
}

}  // namespace leasegate::schema
