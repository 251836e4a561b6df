#pragma once
#include <remit/schema/pause.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(pause<1>&& o, ::scale::Encoder& encoder);
void decode(pause<1>&& o, ::scale::Decoder& decoder);

void encode(unpause<1>&& o, ::scale::Encoder& encoder);
void decode(unpause<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
