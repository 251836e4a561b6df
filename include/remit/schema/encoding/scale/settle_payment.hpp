#pragma once
#include <remit/schema/settle_payment.hpp>
#include <remit/schema/encoding/scale/payment_intent.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(settle_payment<1>&& o, ::scale::Encoder& encoder);
void decode(settle_payment<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
