#pragma once
#include <remit/schema/transaction_event.hpp>
#include <remit/schema/encoding/scale/transaction_event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(transaction_event<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
