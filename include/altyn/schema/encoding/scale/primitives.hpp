#pragma once
#include <altyn/schema/asset_type.hpp>
#include <altyn/schema/primitives.hpp>
#include <altyn/schema/receipt_status.hpp>
#include <altyn/schema/transaction_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Codecs shared by every persisted record. Amounts travel as 32 big-endian
// bytes; enums as their underlying byte.
namespace altyn::schema {

void encode_amount(const amount_t& o, ::scale::Encoder& encoder);
void decode_amount(amount_t& o, ::scale::Decoder& decoder);

void encode(const asset_type_t& o, ::scale::Encoder& encoder);
void decode(asset_type_t& o, ::scale::Decoder& decoder);

void encode(const transaction_type_t& o, ::scale::Encoder& encoder);
void decode(transaction_type_t& o, ::scale::Decoder& decoder);

void encode(const receipt_status_t& o, ::scale::Encoder& encoder);
void decode(receipt_status_t& o, ::scale::Decoder& decoder);

}  // namespace altyn::schema
