#include <remit/schema/encoding/scale/primitives.hpp>
#include <algorithm>
#include <array>
#include <iterator>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(amount_t&& o, ::scale::Encoder& encoder) {
  auto raw = std::array<uint8_t, 32>{};
  auto big_endian = std::vector<uint8_t>{};
  boost::multiprecision::export_bits(o, std::back_inserter(big_endian), 8);
  std::copy(std::rbegin(big_endian), std::rend(big_endian), std::begin(raw));
  encode(raw, encoder);
}

void decode(amount_t&& o, ::scale::Decoder& decoder) {
  auto raw = std::array<uint8_t, 32>{};
  decode(raw, decoder);
  auto value = amount_t{};
  boost::multiprecision::import_bits(value, std::begin(raw), std::end(raw), 8,
                                     false);
  o = value;
}

void encode(ed25519_signer_id&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(secp256k1_signer_id&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace remit::schema::encoding::scale
