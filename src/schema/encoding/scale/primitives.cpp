#include <altyn/schema/encoding/scale/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace altyn::schema {

namespace {

template <typename Enum>
Enum checked_enum(const uint8_t raw, const Enum last) {
  if (raw > static_cast<uint8_t>(last)) {
    throw std::out_of_range{"enum value out of range"};
  }
  return static_cast<Enum>(raw);
}

}  // namespace

void encode_amount(const amount_t& o, ::scale::Encoder& encoder) {
  auto digits = std::vector<uint8_t>{};
  boost::multiprecision::export_bits(o, std::back_inserter(digits), 8);
  auto out = hash32_t{};
  std::copy(std::begin(digits), std::end(digits),
            std::end(out) - static_cast<std::ptrdiff_t>(digits.size()));
  encode(out, encoder);
}

void decode_amount(amount_t& o, ::scale::Decoder& decoder) {
  auto raw = hash32_t{};
  decode(raw, decoder);
  o = amount_t{};
  boost::multiprecision::import_bits(o, std::begin(raw), std::end(raw), 8);
}

void encode(const asset_type_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(asset_type_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = checked_enum(raw, asset_type_t::token);
}

void encode(const transaction_type_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(transaction_type_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = checked_enum(raw, transaction_type_t::service_payment);
}

void encode(const receipt_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(receipt_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = checked_enum(raw, receipt_status_t::failed);
}

}  // namespace altyn::schema
