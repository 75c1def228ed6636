#pragma once

#include <leasegate/crypto/verify.hpp>
#include <leasegate/schema/primitives.hpp>

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace leasegate::testing {

/// Fresh ed25519 key held in OpenSSL. Produces the signer id, account and
/// signatures the engine and attestation gate verify.
class ed25519_key final {
 public:
  ed25519_key() : key_{EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519"),
                       EVP_PKEY_free} {
    if (!key_) {
      throw std::runtime_error{"ed25519 key generation failed"};
    }
    auto size = signer_.public_key.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), signer_.public_key.data(),
                                    &size) != 1 ||
        size != signer_.public_key.size()) {
      throw std::runtime_error{"ed25519 public key export failed"};
    }
  }

  leasegate::schema::signer_id_t signer() const { return signer_; }

  leasegate::schema::account_id_t account() const {
    return leasegate::crypto::account_of(signer());
  }

  leasegate::schema::ed25519_signature_t sign(
      const leasegate::schema::bytes_view_t& message) const {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr,
                                   key_.get()) != 1) {
      throw std::runtime_error{"ed25519 sign init failed"};
    }
    auto signature = leasegate::schema::ed25519_signature_t{};
    auto size = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                       message.size()) != 1 ||
        size != signature.size()) {
      throw std::runtime_error{"ed25519 sign failed"};
    }
    return signature;
  }

  leasegate::schema::ed25519_signature_t sign(
      const leasegate::schema::hash32_t& digest) const {
    return sign(leasegate::schema::bytes_view_t{digest.data(), digest.size()});
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  leasegate::schema::ed25519_signer_id signer_{};
};

}  // namespace leasegate::testing
