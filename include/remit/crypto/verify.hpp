#pragma once

#include <remit/schema/primitives.hpp>

namespace remit::crypto {

bool available();

bool verify_signature(const remit::schema::bytes_view_t& message,
                      const remit::schema::signer_id_t& signer,
                      const remit::schema::signature_t& signature);

/// Account address of a signer: the trailing 20 bytes of blake3(public key).
remit::schema::address_t derive_address(
    const remit::schema::signer_id_t& signer);

}  // namespace remit::crypto
