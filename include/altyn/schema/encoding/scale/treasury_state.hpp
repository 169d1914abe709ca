#pragma once
#include <altyn/schema/treasury_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace altyn::schema {

void encode(const treasury_state<1>& o, ::scale::Encoder& encoder);
void decode(treasury_state<1>& o, ::scale::Decoder& decoder);

}  // namespace altyn::schema
