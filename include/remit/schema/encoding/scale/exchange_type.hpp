#pragma once
#include <remit/schema/exchange_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(exchange_type_t&& o, ::scale::Encoder& encoder);
void decode(exchange_type_t&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
