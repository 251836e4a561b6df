#include <remit/execution/signature_verifier.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace remit::execution {

remit::schema::bytes_t make_signing_payload(
    const remit::schema::transaction_t& tx) {
  auto encoder = remit::schema::encoding::encoder<
      remit::schema::encoding::scale_encoder_tag>{};
  return encoder.encode(std::tuple{tx.version, tx.chain_id, tx.nonce,
                                   tx.signer, tx.value, tx.payload});
}

}  // namespace remit::execution
