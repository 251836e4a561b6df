#include <remit/schema/encoding/scale/transfer_ownership.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(transfer_ownership<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_ownership<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_owner, decoder);
}

void encode(renounce_ownership<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(renounce_ownership<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

}  // namespace remit::schema::encoding::scale
