#include <remit/schema/encoding/scale/settlement_config.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(settlement_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.paused, encoder);
  encode(o.standard_fee_bps, encoder);
  encode(o.fee_receiver, encoder);
  encode(o.special_fees, encoder);
}

void decode(settlement_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.paused, decoder);
  decode(o.standard_fee_bps, decoder);
  decode(o.fee_receiver, decoder);
  decode(o.special_fees, decoder);
}

}  // namespace remit::schema::encoding::scale
