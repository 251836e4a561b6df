#include <remit/schema/encoding/scale/set_fee_receiver.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(set_fee_receiver<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fee_receiver, encoder);
}

void decode(set_fee_receiver<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fee_receiver, decoder);
}

}  // namespace remit::schema::encoding::scale
