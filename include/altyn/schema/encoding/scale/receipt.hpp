#pragma once
#include <altyn/schema/receipt.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace altyn::schema {

void encode(const receipt<1>& o, ::scale::Encoder& encoder);
void decode(receipt<1>& o, ::scale::Decoder& decoder);

}  // namespace altyn::schema
