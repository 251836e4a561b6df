#pragma once
#include <remit/schema/payment_intent.hpp>
#include <remit/schema/encoding/scale/exchange_type.hpp>
#include <remit/schema/encoding/scale/signature_transfer_data.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(payment_intent<1>&& o, ::scale::Encoder& encoder);
void decode(payment_intent<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
