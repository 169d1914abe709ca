#include <altyn/schema/encoding/scale/primitives.hpp>
#include <altyn/schema/encoding/scale/receipt.hpp>

namespace altyn::schema {

void encode(const receipt<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.receipt_id, encoder);
  encode(o.transaction_id, encoder);
  encode(o.date, encoder);
  encode(o.type, encoder);
  encode(o.buyer_id, encoder);
  encode(o.buyer_name, encoder);
  encode(o.seller_id, encoder);
  encode(o.seller_name, encoder);
  encode(o.listing_id, encoder);
  encode_amount(o.total_paid, encoder);
  encode_amount(o.fee_amount, encoder);
  encode(o.status, encoder);
}

void decode(receipt<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.receipt_id, decoder);
  decode(o.transaction_id, decoder);
  decode(o.date, decoder);
  decode(o.type, decoder);
  decode(o.buyer_id, decoder);
  decode(o.buyer_name, decoder);
  decode(o.seller_id, decoder);
  decode(o.seller_name, decoder);
  decode(o.listing_id, decoder);
  decode_amount(o.total_paid, decoder);
  decode_amount(o.fee_amount, decoder);
  decode(o.status, decoder);
}

}  // namespace altyn::schema
