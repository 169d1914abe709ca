#pragma once
#include <altyn/schema/dividend_payout.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace altyn::schema {

void encode(const dividend_share<1>& o, ::scale::Encoder& encoder);
void decode(dividend_share<1>& o, ::scale::Decoder& decoder);

void encode(const dividend_payout<1>& o, ::scale::Encoder& encoder);
void decode(dividend_payout<1>& o, ::scale::Decoder& decoder);

}  // namespace altyn::schema
