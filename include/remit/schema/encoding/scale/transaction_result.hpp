#pragma once
#include <remit/schema/transaction_result.hpp>
#include <remit/schema/encoding/scale/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
