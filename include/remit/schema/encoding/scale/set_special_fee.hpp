#pragma once
#include <remit/schema/set_special_fee.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(set_special_fee<1>&& o, ::scale::Encoder& encoder);
void decode(set_special_fee<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
