#include <altyn/schema/encoding/scale/dividend_payout.hpp>
#include <altyn/schema/encoding/scale/primitives.hpp>

namespace altyn::schema {

void encode(const dividend_share<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account_id, encoder);
  encode_amount(o.token_balance, encoder);
  encode_amount(o.token_percentage, encoder);
  encode_amount(o.amount, encoder);
}

void decode(dividend_share<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account_id, decoder);
  decode_amount(o.token_balance, decoder);
  decode_amount(o.token_percentage, decoder);
  decode_amount(o.amount, decoder);
}

void encode(const dividend_payout<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.sequence, encoder);
  encode(o.created_at, encoder);
  encode_amount(o.total_distributed, encoder);
  encode(o.holders_count, encoder);
  encode(o.distribution_details, encoder);
}

void decode(dividend_payout<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.sequence, decoder);
  decode(o.created_at, decoder);
  decode_amount(o.total_distributed, decoder);
  decode(o.holders_count, decoder);
  decode(o.distribution_details, decoder);
}

}  // namespace altyn::schema
