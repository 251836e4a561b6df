#pragma once
#include <remit/schema/transfer_ownership.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(transfer_ownership<1>&& o, ::scale::Encoder& encoder);
void decode(transfer_ownership<1>&& o, ::scale::Decoder& decoder);

void encode(renounce_ownership<1>&& o, ::scale::Encoder& encoder);
void decode(renounce_ownership<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
