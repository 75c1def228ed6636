#pragma once

#include <leasegate/schema/primitives.hpp>

namespace leasegate::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

bool verify_signature(const leasegate::schema::bytes_view_t& message,
                      const leasegate::schema::signer_id_t& signer,
                      const leasegate::schema::signature_t& signature);

/// Account a signer acts as. Stable for the lifetime of the key.
leasegate::schema::account_id_t account_of(
    const leasegate::schema::signer_id_t& signer);

}  // namespace leasegate::crypto
