#include <remit/schema/encoding/scale/pause.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(pause<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(pause<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(unpause<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(unpause<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

}  // namespace remit::schema::encoding::scale
