#pragma once
#include <remit/schema/signature_transfer_data.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace remit::schema::encoding::scale {

void encode(token_permissions<1>&& o, ::scale::Encoder& encoder);
void decode(token_permissions<1>&& o, ::scale::Decoder& decoder);

void encode(permit_transfer_from<1>&& o, ::scale::Encoder& encoder);
void decode(permit_transfer_from<1>&& o, ::scale::Decoder& decoder);

void encode(signature_transfer_details<1>&& o, ::scale::Encoder& encoder);
void decode(signature_transfer_details<1>&& o, ::scale::Decoder& decoder);

void encode(signature_transfer_data<1>&& o, ::scale::Encoder& encoder);
void decode(signature_transfer_data<1>&& o, ::scale::Decoder& decoder);

}  // namespace remit::schema::encoding::scale
