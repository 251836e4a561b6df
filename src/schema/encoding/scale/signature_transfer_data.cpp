#include <remit/schema/encoding/scale/signature_transfer_data.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(token_permissions<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.token, encoder);
  encode(o.amount, encoder);
}

void decode(token_permissions<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.token, decoder);
  decode(o.amount, decoder);
}

void encode(permit_transfer_from<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.permitted, encoder);
  encode(o.nonce, encoder);
  encode(o.deadline, encoder);
}

void decode(permit_transfer_from<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.permitted, decoder);
  decode(o.nonce, decoder);
  decode(o.deadline, decoder);
}

void encode(signature_transfer_details<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.to, encoder);
  encode(o.requested_amount, encoder);
}

void decode(signature_transfer_details<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.to, decoder);
  decode(o.requested_amount, decoder);
}

void encode(signature_transfer_data<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.use_signature_transfer, encoder);
  encode(o.permit, encoder);
  encode(o.transfer_details, encoder);
  encode(o.signature, encoder);
}

void decode(signature_transfer_data<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.use_signature_transfer, decoder);
  decode(o.permit, decoder);
  decode(o.transfer_details, decoder);
  decode(o.signature, decoder);
}

}  // namespace remit::schema::encoding::scale
