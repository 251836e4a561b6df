#include <remit/schema/encoding/scale/exchange_type.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(exchange_type_t&& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(exchange_type_t&& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<exchange_type_t>(raw);
}

}  // namespace remit::schema::encoding::scale
