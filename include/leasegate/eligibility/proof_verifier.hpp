#pragma once

#include <leasegate/schema/primitives.hpp>
#include <functional>
#include <string_view>
#include <vector>

namespace leasegate::eligibility {

/// Succinct proof check against fixed public parameters. The proving system
/// itself lives outside this process.
class proof_verifier {
 public:
  virtual ~proof_verifier() = default;

  virtual bool verify(
      const leasegate::schema::bytes_view_t& proof,
      const std::vector<leasegate::schema::field_element_t>& public_inputs) = 0;

  virtual std::string_view name() const = 0;
};

/// Accepts every proof. Development only; construction always warns.
class unsafe_stub_proof_verifier final : public proof_verifier {
 public:
  static constexpr auto kName =
      std::string_view{"UNSAFE-STUB-NOT-FOR-PRODUCTION"};

  unsafe_stub_proof_verifier();

  bool verify(const leasegate::schema::bytes_view_t& proof,
              const std::vector<leasegate::schema::field_element_t>&
                  public_inputs) override;

  std::string_view name() const override { return kName; }
};

/// Proving-system entry point: (verification key, proof, public inputs).
using proof_backend_t = std::function<bool(
    const leasegate::schema::bytes_view_t& verification_key,
    const leasegate::schema::bytes_view_t& proof,
    const std::vector<leasegate::schema::field_element_t>& public_inputs)>;

/// Production verifier bound to one verification key. Fails closed: with no
/// backend installed, an empty proof or a malformed input vector, the answer
/// is false.
class backend_proof_verifier final : public proof_verifier {
 public:
  static constexpr auto kName = std::string_view{"backend"};

  explicit backend_proof_verifier(leasegate::schema::bytes_t verification_key,
                                  proof_backend_t backend = {});

  bool verify(const leasegate::schema::bytes_view_t& proof,
              const std::vector<leasegate::schema::field_element_t>&
                  public_inputs) override;

  std::string_view name() const override { return kName; }

  void set_backend(proof_backend_t backend);

  const leasegate::schema::hash32_t& verification_key_id() const {
    return verification_key_id_;
  }

 private:
  leasegate::schema::bytes_t verification_key_;
  leasegate::schema::hash32_t verification_key_id_;
  proof_backend_t backend_;
};

}  // namespace leasegate::eligibility
