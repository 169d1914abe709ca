#pragma once
#include <altyn/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace altyn::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace altyn::schema
