#include <remit/schema/encoding/scale/payment_intent.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(payment_intent<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.amount_in, encoder);
  encode(o.receipt_amount, encoder);
  encode(o.deadline, encoder);
  encode(o.token_in, encoder);
  encode(o.receipt_token, encoder);
  encode(o.exchange_address, encoder);
  encode(o.exchange_call_data, encoder);
  encode(o.exchange_type, encoder);
  encode(o.payment_receiver, encoder);
  encode(o.receiver_call_data, encoder);
  encode(o.signature_transfer_data, encoder);
}

void decode(payment_intent<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.amount_in, decoder);
  decode(o.receipt_amount, decoder);
  decode(o.deadline, decoder);
  decode(o.token_in, decoder);
  decode(o.receipt_token, decoder);
  decode(o.exchange_address, decoder);
  decode(o.exchange_call_data, decoder);
  decode(o.exchange_type, decoder);
  decode(o.payment_receiver, decoder);
  decode(o.receiver_call_data, decoder);
  decode(o.signature_transfer_data, decoder);
}

}  // namespace remit::schema::encoding::scale
