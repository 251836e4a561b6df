#pragma once
#include <remit/schema/ledger_snapshot.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(ledger_snapshot<1>&& o, ::scale::Encoder& encoder);
void decode(ledger_snapshot<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
