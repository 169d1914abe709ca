#include <altyn/schema/encoding/scale/primitives.hpp>
#include <altyn/schema/encoding/scale/transaction.hpp>

namespace altyn::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.sequence, encoder);
  encode(o.type, encoder);
  encode(o.asset, encoder);
  encode(o.from_account, encoder);
  encode(o.to_account, encoder);
  encode_amount(o.amount, encoder);
  encode_amount(o.fee, encoder);
  encode_amount(o.net_amount, encoder);
  encode(o.created_at, encoder);
  encode(o.description, encoder);
  encode(o.reference, encoder);
  encode(o.previous_hash, encoder);
  encode(o.hash, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.sequence, decoder);
  decode(o.type, decoder);
  decode(o.asset, decoder);
  decode(o.from_account, decoder);
  decode(o.to_account, decoder);
  decode_amount(o.amount, decoder);
  decode_amount(o.fee, decoder);
  decode_amount(o.net_amount, decoder);
  decode(o.created_at, decoder);
  decode(o.description, decoder);
  decode(o.reference, decoder);
  decode(o.previous_hash, decoder);
  decode(o.hash, decoder);
}

}  // namespace altyn::schema
