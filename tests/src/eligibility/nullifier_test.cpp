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
using leasegate::schema::field_element_t;
using leasegate::testing::kGenesisTime;
using leasegate::testing::make_context;

namespace {

// Both gates over one set of registries, as the engine wires them.
class shared_nullifier_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!leasegate::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto "
                      "providers";
    }
    policy_id_ = state_.create_policy(owner_);
    proof_gate_ = std::make_unique<leasegate::eligibility::gate>(
        state_.journal(), state_.policies(), state_.nullifiers(),
        state_.eligibility(),
        std::make_unique<leasegate::eligibility::proof_eligibility_verifier>(
            std::make_unique<
                leasegate::eligibility::unsafe_stub_proof_verifier>()));
    attestation_gate_ = std::make_unique<leasegate::eligibility::gate>(
        state_.journal(), state_.policies(), state_.nullifiers(),
        state_.eligibility(),
        std::make_unique<
            leasegate::eligibility::attestation_eligibility_verifier>(
            state_.journal(), issuer_.signer(), domain_, owner_));
  }

  leasegate::schema::proof_claim_t proof_claim(const field_element_t& high,
                                               const field_element_t& low) {
    const auto terms = leasegate::testing::make_terms();
    return leasegate::schema::proof_claim_t{
        .proof = leasegate::schema::bytes_t{0x01},
        .public_inputs = {field_element_t{terms.min_age},
                          field_element_t{terms.income_multiplier},
                          terms.rent_amount, field_element_t{1},
                          field_element_t{policy_id_}, high, low}};
  }

  leasegate::schema::signed_attestation_t attestation(
      const leasegate::schema::account_id_t& wallet,
      const leasegate::schema::nullifier_t& nullifier) {
    auto claim = leasegate::schema::attestation_claim_t{
        .wallet = wallet,
        .policy_id = policy_id_,
        .expiry = kGenesisTime + 60,
        .nullifier = nullifier,
        .pass_bitmask = leasegate::schema::kPassAll};
    return leasegate::schema::signed_attestation_t{
        .claim = claim,
        .signature = issuer_.sign(
            leasegate::eligibility::attestation_digest(domain_, claim))};
  }

  leasegate::testing::state_fixture state_{"leasegate_shared_nullifier"};
  leasegate::testing::ed25519_key issuer_{};
  leasegate::eligibility::attestation_domain domain_{
      .chain_id = leasegate::testing::make_hash(50)};
  leasegate::schema::account_id_t owner_{leasegate::testing::make_hash(1)};
  leasegate::schema::account_id_t alice_{leasegate::testing::make_hash(2)};
  leasegate::schema::account_id_t bob_{leasegate::testing::make_hash(3)};
  leasegate::schema::policy_id_t policy_id_{};
  std::unique_ptr<leasegate::eligibility::gate> proof_gate_;
  std::unique_ptr<leasegate::eligibility::gate> attestation_gate_;
};

}  // namespace

TEST_F(shared_nullifier_test, proof_nullifier_blocks_attestation) {
  ASSERT_TRUE(proof_gate_
                  ->submit_proof(make_context(alice_), policy_id_,
                                 proof_claim(11, 22))
                  .ok());
  auto reused = leasegate::eligibility::nullifier_from_limbs(11, 22);
  auto result = attestation_gate_->submit_attestation(
      make_context(bob_), attestation(bob_, reused));
  EXPECT_EQ(result.code, error_code::replay);
  EXPECT_FALSE(attestation_gate_->is_eligible(bob_, policy_id_));
}

TEST_F(shared_nullifier_test, attestation_nullifier_blocks_proof) {
  auto nullifier = leasegate::eligibility::nullifier_from_limbs(5, 6);
  ASSERT_TRUE(attestation_gate_
                  ->submit_attestation(make_context(alice_),
                                       attestation(alice_, nullifier))
                  .ok());
  auto result = proof_gate_->submit_proof(make_context(bob_), policy_id_,
                                          proof_claim(5, 6));
  EXPECT_EQ(result.code, error_code::replay);
  EXPECT_TRUE(proof_gate_->is_nullifier_used(nullifier));
}

TEST_F(shared_nullifier_test, eligibility_is_visible_through_either_gate) {
  ASSERT_TRUE(proof_gate_
                  ->submit_proof(make_context(alice_), policy_id_,
                                 proof_claim(1, 1))
                  .ok());
  EXPECT_TRUE(attestation_gate_->is_eligible(alice_, policy_id_));
}

TEST_F(shared_nullifier_test, rejected_claim_spends_nothing) {
  auto claim = proof_claim(3, 4);
  claim.public_inputs[2] += 1;
  EXPECT_EQ(
      proof_gate_->submit_proof(make_context(alice_), policy_id_, claim).code,
      error_code::parameter_mismatch);
  EXPECT_TRUE(proof_gate_
                  ->submit_proof(make_context(alice_), policy_id_,
                                 proof_claim(3, 4))
                  .ok());
}
