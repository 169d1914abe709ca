#pragma once
#include <altyn/schema/log_head.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace altyn::schema {

void encode(const log_head<1>& o, ::scale::Encoder& encoder);
void decode(log_head<1>& o, ::scale::Decoder& decoder);

}  // namespace altyn::schema
