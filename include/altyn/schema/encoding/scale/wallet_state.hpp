#pragma once
#include <altyn/schema/wallet_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace altyn::schema {

void encode(const wallet_state<1>& o, ::scale::Encoder& encoder);
void decode(wallet_state<1>& o, ::scale::Decoder& decoder);

}  // namespace altyn::schema
