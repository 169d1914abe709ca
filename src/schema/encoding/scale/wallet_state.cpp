#include <altyn/schema/encoding/scale/primitives.hpp>
#include <altyn/schema/encoding/scale/wallet_state.hpp>

namespace altyn::schema {

void encode(const wallet_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account_id, encoder);
  encode_amount(o.coin_balance, encoder);
  encode_amount(o.token_balance, encoder);
  encode_amount(o.dividends_received, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(wallet_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account_id, decoder);
  decode_amount(o.coin_balance, decoder);
  decode_amount(o.token_balance, decoder);
  decode_amount(o.dividends_received, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace altyn::schema
