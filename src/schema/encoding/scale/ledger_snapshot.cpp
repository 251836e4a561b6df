#include <remit/schema/encoding/scale/ledger_snapshot.hpp>

using namespace remit::schema;

namespace remit::schema::encoding::scale {

void encode(ledger_snapshot<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.time, encoder);
  encode(o.native_balances, encoder);
  encode(o.token_balances, encoder);
  encode(o.token_supplies, encoder);
  encode(o.allowances, encoder);
  encode(o.nonce_words, encoder);
}

void decode(ledger_snapshot<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.time, decoder);
  decode(o.native_balances, decoder);
  decode(o.token_balances, decoder);
  decode(o.token_supplies, decoder);
  decode(o.allowances, decoder);
  decode(o.nonce_words, decoder);
}

}  // namespace remit::schema::encoding::scale
