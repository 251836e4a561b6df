#pragma once
#include <remit/schema/transaction.hpp>
#include <remit/schema/encoding/scale/pause.hpp>
#include <remit/schema/encoding/scale/primitives.hpp>
#include <remit/schema/encoding/scale/set_fee_receiver.hpp>
#include <remit/schema/encoding/scale/set_service_fee.hpp>
#include <remit/schema/encoding/scale/set_special_fee.hpp>
#include <remit/schema/encoding/scale/settle_payment.hpp>
#include <remit/schema/encoding/scale/transfer_ownership.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder);
void decode(transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
