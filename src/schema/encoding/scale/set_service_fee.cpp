#include <remit/schema/encoding/scale/set_service_fee.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(set_service_fee<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.rate, encoder);
}

void decode(set_service_fee<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.rate, decoder);
}

}  // namespace remit::schema::encoding::scale
