#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/schema/transaction.hpp>

#include <tuple>

namespace leasegate::schema {

bytes_t make_signing_payload(const transaction_t& tx) {
  auto encoder = encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{tx.version, tx.chain_id, tx.nonce,
                                   tx.signer, to_be_bytes(tx.value),
                                   tx.payload});
}

}  // namespace leasegate::schema
