#pragma once

#include <remit/schema/primitives.hpp>
#include <remit/schema/transaction.hpp>
#include <functional>

namespace remit::execution {

using signature_verifier_t =
    std::function<bool(const remit::schema::bytes_view_t& message,
                       const remit::schema::signer_id_t& signer,
                       const remit::schema::signature_t& signature)>;

/// Bytes a signer signs: the SCALE encoding of every envelope field except
/// the signature itself.
remit::schema::bytes_t make_signing_payload(
    const remit::schema::transaction_t& tx);

}  // namespace remit::execution
