#include <remit/schema/encoding/scale/settle_payment.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(settle_payment<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.intent, encoder);
}

void decode(settle_payment<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.intent, decoder);
}

}  // namespace remit::schema::encoding::scale
