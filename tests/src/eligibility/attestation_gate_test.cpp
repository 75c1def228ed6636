#include <gtest/gtest.h>
#include <leasegate/crypto/verify.hpp>
#include <leasegate/eligibility/attestation.hpp>
#include <leasegate/eligibility/eligibility_verifier.hpp>
#include <leasegate/eligibility/gate.hpp>
#include <leasegate/testing/common.hpp>
#include <leasegate/testing/signing.hpp>
#include <leasegate/testing/state_fixture.hpp>

#include <memory>

using leasegate::schema::error_code;
using leasegate::testing::kDeadline;
using leasegate::testing::kGenesisTime;
using leasegate::testing::make_context;

namespace {

class attestation_gate_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!leasegate::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto "
                      "providers";
    }
    policy_id_ = state_.create_policy(owner_);
    auto verifier =
        std::make_unique<leasegate::eligibility::attestation_eligibility_verifier>(
            state_.journal(), issuer_.signer(), domain_, administrator_);
    verifier_ = verifier.get();
    gate_ = std::make_unique<leasegate::eligibility::gate>(
        state_.journal(), state_.policies(), state_.nullifiers(),
        state_.eligibility(), std::move(verifier));
  }

  leasegate::schema::attestation_claim_t make_claim(
      const uint8_t nullifier_seed = 40) const {
    return leasegate::schema::attestation_claim_t{
        .wallet = tenant_,
        .policy_id = policy_id_,
        .expiry = kGenesisTime + 3'600,
        .nullifier = leasegate::testing::make_hash(nullifier_seed),
        .pass_bitmask = leasegate::schema::kPassAll};
  }

  leasegate::schema::signed_attestation_t sign(
      const leasegate::schema::attestation_claim_t& claim,
      const leasegate::testing::ed25519_key& key) const {
    return leasegate::schema::signed_attestation_t{
        .claim = claim,
        .signature = key.sign(
            leasegate::eligibility::attestation_digest(domain_, claim))};
  }

  leasegate::schema::signed_attestation_t sign(
      const leasegate::schema::attestation_claim_t& claim) const {
    return sign(claim, issuer_);
  }

  leasegate::testing::state_fixture state_{"leasegate_attestation_gate"};
  leasegate::testing::ed25519_key issuer_{};
  leasegate::schema::account_id_t owner_{leasegate::testing::make_hash(1)};
  leasegate::schema::account_id_t tenant_{leasegate::testing::make_hash(2)};
  leasegate::schema::account_id_t administrator_{
      leasegate::testing::make_hash(3)};
  leasegate::eligibility::attestation_domain domain_{
      .name = "leasegate.attestation",
      .version = "1",
      .chain_id = leasegate::testing::make_hash(100),
      .verifying_gate = leasegate::eligibility::default_gate_id(
          leasegate::testing::make_hash(100))};
  leasegate::schema::policy_id_t policy_id_{};
  leasegate::eligibility::attestation_eligibility_verifier* verifier_{};
  std::unique_ptr<leasegate::eligibility::gate> gate_;
};

}  // namespace

TEST_F(attestation_gate_test, accepts_issuer_signed_attestation) {
  auto result = gate_->submit_attestation(make_context(tenant_),
                                          sign(make_claim()));
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(*result.value, leasegate::testing::make_hash(40));
  EXPECT_TRUE(gate_->is_eligible(tenant_, policy_id_));
}

TEST_F(attestation_gate_test, wallet_must_be_the_caller) {
  auto result = gate_->submit_attestation(
      make_context(leasegate::testing::make_hash(9)), sign(make_claim()));
  EXPECT_EQ(result.code, error_code::wallet_mismatch);
  EXPECT_FALSE(gate_->is_nullifier_used(leasegate::testing::make_hash(40)));
}

TEST_F(attestation_gate_test, expiry_at_now_is_expired) {
  auto claim = make_claim();
  claim.expiry = kGenesisTime;
  auto result =
      gate_->submit_attestation(make_context(tenant_), sign(claim));
  EXPECT_EQ(result.code, error_code::claim_expired);
}

TEST_F(attestation_gate_test, partial_bitmask_is_ineligible) {
  auto claim = make_claim();
  claim.pass_bitmask = 0b011;
  auto result =
      gate_->submit_attestation(make_context(tenant_), sign(claim));
  EXPECT_EQ(result.code, error_code::ineligible);
  EXPECT_FALSE(gate_->is_eligible(tenant_, policy_id_));
  EXPECT_FALSE(gate_->is_nullifier_used(claim.nullifier));
}

TEST_F(attestation_gate_test, signature_from_untrusted_key_is_rejected) {
  auto stranger = leasegate::testing::ed25519_key{};
  auto result = gate_->submit_attestation(make_context(tenant_),
                                          sign(make_claim(), stranger));
  EXPECT_EQ(result.code, error_code::invalid_signature);
}

TEST_F(attestation_gate_test, tampered_claim_is_rejected) {
  auto signed_claim = sign(make_claim());
  signed_claim.claim.expiry += 1;
  auto result =
      gate_->submit_attestation(make_context(tenant_), signed_claim);
  EXPECT_EQ(result.code, error_code::invalid_signature);
}

TEST_F(attestation_gate_test, signature_for_another_gate_is_rejected) {
  auto other_domain = domain_;
  other_domain.verifying_gate = leasegate::testing::make_hash(77);
  auto claim = make_claim();
  auto attestation = leasegate::schema::signed_attestation_t{
      .claim = claim,
      .signature = issuer_.sign(
          leasegate::eligibility::attestation_digest(other_domain, claim))};
  EXPECT_EQ(gate_->submit_attestation(make_context(tenant_), attestation).code,
            error_code::invalid_signature);
}

TEST_F(attestation_gate_test, closed_policy_is_rejected) {
  auto claim = make_claim();
  claim.expiry = kDeadline + 10;
  auto result =
      gate_->submit_attestation(make_context(tenant_, kDeadline), sign(claim));
  EXPECT_EQ(result.code, error_code::policy_expired);
}

TEST_F(attestation_gate_test, replayed_attestation_is_rejected) {
  auto attestation = sign(make_claim());
  ASSERT_TRUE(
      gate_->submit_attestation(make_context(tenant_), attestation).ok());
  EXPECT_EQ(gate_->submit_attestation(make_context(tenant_), attestation).code,
            error_code::replay);
}

TEST_F(attestation_gate_test, only_administrator_rotates_issuer) {
  auto next = leasegate::testing::ed25519_key{};
  auto denied = verifier_->set_issuer(make_context(tenant_), next.signer());
  EXPECT_EQ(denied.code, error_code::not_gate_administrator);
  EXPECT_EQ(verifier_->issuer(), issuer_.signer());

  ASSERT_TRUE(
      verifier_->set_issuer(make_context(administrator_), next.signer()).ok());
  EXPECT_EQ(verifier_->issuer(), next.signer());

  EXPECT_EQ(gate_->submit_attestation(make_context(tenant_),
                                      sign(make_claim(41)))
                .code,
            error_code::invalid_signature);
  EXPECT_TRUE(gate_->submit_attestation(make_context(tenant_),
                                        sign(make_claim(42), next))
                  .ok());
}

TEST(attestation_digest, binds_every_claim_field) {
  auto domain = leasegate::eligibility::attestation_domain{
      .chain_id = leasegate::testing::make_hash(1)};
  auto claim = leasegate::schema::attestation_claim_t{
      .wallet = leasegate::testing::make_hash(2),
      .policy_id = 1,
      .expiry = 100,
      .nullifier = leasegate::testing::make_hash(3),
      .pass_bitmask = 7};
  const auto base = leasegate::eligibility::attestation_digest(domain, claim);

  auto changed = claim;
  changed.policy_id = 2;
  EXPECT_NE(leasegate::eligibility::attestation_digest(domain, changed), base);
  changed = claim;
  changed.pass_bitmask = 3;
  EXPECT_NE(leasegate::eligibility::attestation_digest(domain, changed), base);
  changed = claim;
  changed.nullifier = leasegate::testing::make_hash(4);
  EXPECT_NE(leasegate::eligibility::attestation_digest(domain, changed), base);

  auto other_chain = domain;
  other_chain.chain_id = leasegate::testing::make_hash(5);
  EXPECT_NE(leasegate::eligibility::attestation_digest(other_chain, claim),
            base);
}

TEST(nullifier_limbs, pack_high_above_low) {
  auto packed = leasegate::eligibility::nullifier_from_limbs(1, 2);
  EXPECT_EQ(packed[15], 0x01);
  EXPECT_EQ(packed[31], 0x02);
  for (std::size_t i = 0; i < 15; ++i) {
    EXPECT_EQ(packed[i], 0x00);
  }
}
