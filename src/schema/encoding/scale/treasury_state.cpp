#include <altyn/schema/encoding/scale/primitives.hpp>
#include <altyn/schema/encoding/scale/treasury_state.hpp>

namespace altyn::schema {

void encode(const treasury_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_amount(o.collected_fees, encoder);
  encode_amount(o.total_coins_in_circulation, encoder);
  encode_amount(o.total_token_supply, encoder);
  encode_amount(o.lifetime_fees, encoder);
  encode_amount(o.lifetime_dividends, encoder);
}

void decode(treasury_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode_amount(o.collected_fees, decoder);
  decode_amount(o.total_coins_in_circulation, decoder);
  decode_amount(o.total_token_supply, decoder);
  decode_amount(o.lifetime_fees, decoder);
  decode_amount(o.lifetime_dividends, decoder);
}

}  // namespace altyn::schema
