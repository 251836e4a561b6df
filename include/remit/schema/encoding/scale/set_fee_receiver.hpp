#pragma once
#include <remit/schema/set_fee_receiver.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(set_fee_receiver<1>&& o, ::scale::Encoder& encoder);
void decode(set_fee_receiver<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
