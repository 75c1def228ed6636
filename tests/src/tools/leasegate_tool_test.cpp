#include <gtest/gtest.h>
#include <leasegate/crypto/verify.hpp>
#include <leasegate/eligibility/attestation.hpp>
#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/schema/policy.hpp>
#include <leasegate/schema/primitives.hpp>
#include <leasegate/schema/transaction.hpp>
#include <leasegate/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef LEASEGATE_TOOL_PATH
#define LEASEGATE_TOOL_PATH ""
#endif

namespace {

using encoder_t = leasegate::schema::encoding::scale_encoder_t;

constexpr auto kChainId =
    "c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0";
constexpr auto kOwner =
    "abababababababababababababababababababababababababababababababab";
constexpr auto kSignerKey =
    "1111111111111111111111111111111111111111111111111111111111111111";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_tool(const std::string& tool, const std::string_view args) {
  auto command = shell_quote(tool) + " " + std::string{args} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string tool_path() {
  auto tool = std::string{LEASEGATE_TOOL_PATH};
  if (tool.empty() || !std::filesystem::exists(tool)) {
    return {};
  }
  return tool;
}

}  // namespace

TEST(leasegate_tool, policy_hash_matches_library) {
  auto tool = tool_path();
  if (tool.empty()) {
    GTEST_SKIP() << "leasegate_tool binary not available";
  }
  auto terms = leasegate::schema::policy_terms_t{
      .min_age = 18,
      .income_multiplier = 3,
      .rent_amount = leasegate::schema::amount_t{1'000'000'000'000'000'000ULL},
      .require_clean_record = true,
      .deadline = 1'700'086'400};
  auto expected = leasegate::schema::compute_policy_hash(
      terms, leasegate::schema::make_hash32(std::string_view{kOwner}));

  auto actual = run_tool(
      tool, std::string{"policy-hash --min-age 18 --income-multiplier 3 "
                        "--rent-amount 1000000000000000000 "
                        "--require-clean-record 1 --deadline 1700086400 "
                        "--owner "} +
                kOwner);
  EXPECT_EQ(actual, leasegate::schema::to_hex(expected));
}

TEST(leasegate_tool, nullifier_packs_limbs) {
  auto tool = tool_path();
  if (tool.empty()) {
    GTEST_SKIP() << "leasegate_tool binary not available";
  }
  auto actual = run_tool(tool, "nullifier --high 1 --low 2");
  EXPECT_EQ(actual, leasegate::schema::to_hex(
                        leasegate::eligibility::nullifier_from_limbs(1, 2)));
}

TEST(leasegate_tool, attestation_digest_uses_default_gate) {
  auto tool = tool_path();
  if (tool.empty()) {
    GTEST_SKIP() << "leasegate_tool binary not available";
  }
  auto chain_id = leasegate::schema::make_hash32(std::string_view{kChainId});
  auto domain = leasegate::eligibility::attestation_domain{
      .chain_id = chain_id,
      .verifying_gate = leasegate::eligibility::default_gate_id(chain_id)};
  auto claim = leasegate::schema::attestation_claim_t{
      .wallet = leasegate::schema::make_hash32(std::string_view{kOwner}),
      .policy_id = 4,
      .expiry = 1'700'000'600,
      .nullifier = leasegate::testing::make_hash(9),
      .pass_bitmask = 7};

  auto actual = run_tool(
      tool, std::string{"attestation-digest --chain-id "} + kChainId +
                " --wallet " + kOwner +
                " --policy-id 4 --expiry 1700000600 --pass-bitmask 7 "
                "--nullifier " +
                leasegate::schema::to_hex(claim.nullifier));
  EXPECT_EQ(actual, leasegate::schema::to_hex(
                        leasegate::eligibility::attestation_digest(domain,
                                                                   claim)));
}

TEST(leasegate_tool, account_id_matches_library) {
  auto tool = tool_path();
  if (tool.empty()) {
    GTEST_SKIP() << "leasegate_tool binary not available";
  }
  auto signer = std::string{"ed25519:"} + kSignerKey;
  auto actual = run_tool(tool, "account-id --signer " + signer);
  EXPECT_EQ(actual,
            leasegate::schema::to_hex(leasegate::crypto::account_of(
                *leasegate::schema::try_parse_signer(signer))));
}

TEST(leasegate_tool, transaction_decodes_to_requested_payload) {
  auto tool = tool_path();
  if (tool.empty()) {
    GTEST_SKIP() << "leasegate_tool binary not available";
  }
  auto hex = run_tool(
      tool, std::string{"transaction --payload start_lease --policy-id 3 "
                        "--nonce 2 --value 1000000000000000000 --chain-id "} +
                kChainId + " --signer ed25519:" + kSignerKey);
  auto raw = leasegate::schema::try_from_hex(hex);
  ASSERT_TRUE(raw.has_value());

  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<leasegate::schema::transaction_t>(
      leasegate::schema::make_bytes_view(*raw));
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->nonce, 2u);
  EXPECT_EQ(tx->value,
            leasegate::schema::amount_t{1'000'000'000'000'000'000ULL});
  ASSERT_TRUE(
      std::holds_alternative<leasegate::schema::start_lease_t>(tx->payload));
  EXPECT_EQ(std::get<leasegate::schema::start_lease_t>(tx->payload).policy_id,
            3u);

  auto payload = run_tool(
      tool, std::string{"signing-payload --payload start_lease --policy-id 3 "
                        "--nonce 2 --value 1000000000000000000 --chain-id "} +
                kChainId + " --signer ed25519:" + kSignerKey);
  EXPECT_EQ(payload, leasegate::schema::to_hex(leasegate::schema::make_bytes_view(
                         leasegate::schema::make_signing_payload(*tx))));
}
