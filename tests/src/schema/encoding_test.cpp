#include <gtest/gtest.h>
#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/schema/lease.hpp>
#include <leasegate/schema/policy.hpp>
#include <leasegate/schema/transaction.hpp>
#include <leasegate/testing/common.hpp>

#include <algorithm>
#include <vector>

namespace {

using encoder_t = leasegate::schema::encoding::scale_encoder_t;

leasegate::schema::transaction_t make_start_lease_tx() {
  return leasegate::schema::transaction_t{
      .version = 1,
      .chain_id = leasegate::testing::make_hash(1),
      .nonce = 3,
      .signer = leasegate::testing::make_ed25519_signer(7),
      .value = leasegate::schema::amount_t{1'000'000'000'000'000'000ULL},
      .payload = leasegate::schema::start_lease_t{.policy_id = 1},
      .signature = leasegate::schema::ed25519_signature_t{}};
}

bool contains(const leasegate::schema::bytes_t& haystack,
              const leasegate::schema::hash32_t& needle) {
  return std::search(std::begin(haystack), std::end(haystack),
                     std::begin(needle),
                     std::end(needle)) != std::end(haystack);
}

}  // namespace

TEST(encoding, policy_survives_storage_encoding) {
  auto encoder = encoder_t{};
  auto policy = leasegate::schema::policy_t{
      .min_age = 21,
      .income_multiplier = 3,
      .rent_amount = leasegate::schema::amount_t{"1000000000000000000000000"},
      .require_clean_record = true,
      .deadline = 1'800'000'000,
      .owner = leasegate::testing::make_hash(4),
      .content_hash = leasegate::testing::make_hash(5)};
  auto decoded = encoder.decode<leasegate::schema::policy_t>(
      leasegate::schema::make_bytes_view(encoder.encode(policy)));
  EXPECT_EQ(decoded.min_age, 21u);
  EXPECT_EQ(decoded.rent_amount, policy.rent_amount);
  EXPECT_EQ(decoded.owner, policy.owner);
  EXPECT_EQ(decoded.content_hash, policy.content_hash);
  EXPECT_TRUE(decoded.require_clean_record);
}

TEST(encoding, lease_status_survives_storage_encoding) {
  auto encoder = encoder_t{};
  auto lease = leasegate::schema::lease_t{
      .tenant = leasegate::testing::make_hash(2),
      .amount = leasegate::schema::amount_t{42},
      .deadline = 99,
      .active = false,
      .status = leasegate::schema::lease_status_t::refunded,
      .started_at = 10};
  auto decoded = encoder.decode<leasegate::schema::lease_t>(
      leasegate::schema::make_bytes_view(encoder.encode(lease)));
  EXPECT_EQ(decoded.status, leasegate::schema::lease_status_t::refunded);
  EXPECT_FALSE(decoded.active);
  EXPECT_EQ(decoded.amount, leasegate::schema::amount_t{42});
}

TEST(encoding, amounts_travel_as_32_big_endian_bytes) {
  auto encoder = encoder_t{};
  auto tx = make_start_lease_tx();
  auto encoded = encoder.encode(tx);
  EXPECT_TRUE(contains(encoded, leasegate::schema::to_be_bytes(tx.value)));
}

TEST(encoding, signing_payload_excludes_signature) {
  auto tx = make_start_lease_tx();
  auto unsigned_payload = leasegate::schema::make_signing_payload(tx);
  auto signature = leasegate::schema::ed25519_signature_t{};
  signature.fill(0x5A);
  tx.signature = signature;
  EXPECT_EQ(leasegate::schema::make_signing_payload(tx), unsigned_payload);

  tx.nonce += 1;
  EXPECT_NE(leasegate::schema::make_signing_payload(tx), unsigned_payload);
}

TEST(encoding, signing_payload_commits_to_value) {
  auto tx = make_start_lease_tx();
  auto original = leasegate::schema::make_signing_payload(tx);
  tx.value += 1;
  EXPECT_NE(leasegate::schema::make_signing_payload(tx), original);
}

TEST(encoding, transaction_decodes_with_payload_intact) {
  auto encoder = encoder_t{};
  auto tx = make_start_lease_tx();
  auto decoded = encoder.try_decode<leasegate::schema::transaction_t>(
      leasegate::schema::make_bytes_view(encoder.encode(tx)));
  ASSERT_TRUE(decoded.has_value());
  ASSERT_TRUE(
      std::holds_alternative<leasegate::schema::start_lease_t>(decoded->payload));
  EXPECT_EQ(std::get<leasegate::schema::start_lease_t>(decoded->payload)
                .policy_id,
            1u);
  EXPECT_EQ(decoded->value, tx.value);
  EXPECT_EQ(decoded->signer, tx.signer);
}

TEST(encoding, proof_claim_keeps_every_public_input) {
  auto encoder = encoder_t{};
  const auto big = leasegate::schema::field_element_t{
      (leasegate::schema::field_element_t{1} << 200) + 17};
  auto tx = make_start_lease_tx();
  tx.value = 0;
  tx.payload = leasegate::schema::submit_proof_t{
      .policy_id = 2,
      .claim = leasegate::schema::proof_claim_t{
          .proof = leasegate::schema::bytes_t{0x01, 0x02},
          .public_inputs = {18, 3, big, 1, 2, 0, 5}}};
  auto decoded = encoder.try_decode<leasegate::schema::transaction_t>(
      leasegate::schema::make_bytes_view(encoder.encode(tx)));
  ASSERT_TRUE(decoded.has_value());
  const auto& proof =
      std::get<leasegate::schema::submit_proof_t>(decoded->payload);
  ASSERT_EQ(proof.claim.public_inputs.size(), 7u);
  EXPECT_EQ(proof.claim.public_inputs[2], big);
  EXPECT_EQ(proof.claim.public_inputs[6], 5u);
}

TEST(encoding, truncated_transaction_is_rejected) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_start_lease_tx());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<leasegate::schema::transaction_t>(
                       leasegate::schema::make_bytes_view(encoded))
                   .has_value());
}
