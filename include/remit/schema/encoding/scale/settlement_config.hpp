#pragma once
#include <remit/schema/settlement_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(settlement_config<1>&& o, ::scale::Encoder& encoder);
void decode(settlement_config<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
