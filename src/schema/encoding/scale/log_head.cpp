#include <altyn/schema/encoding/scale/log_head.hpp>

namespace altyn::schema {

void encode(const log_head<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.hash, encoder);
  encode(o.payout_sequence, encoder);
}

void decode(log_head<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.hash, decoder);
  decode(o.payout_sequence, decoder);
}

}  // namespace altyn::schema
