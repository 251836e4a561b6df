#pragma once
#include <remit/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

/// 256-bit amounts travel as 32 little-endian bytes.
void encode(amount_t&& o, ::scale::Encoder& encoder);
void decode(amount_t&& o, ::scale::Decoder& decoder);

void encode(ed25519_signer_id&& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id&& o, ::scale::Decoder& decoder);

void encode(secp256k1_signer_id&& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
