#pragma once
#include <altyn/common/critical.hpp>
#include <altyn/schema/encoding/encoder.hpp>
#include <altyn/schema/encoding/scale/dividend_payout.hpp>
#include <altyn/schema/encoding/scale/log_head.hpp>
#include <altyn/schema/encoding/scale/primitives.hpp>
#include <altyn/schema/encoding/scale/receipt.hpp>
#include <altyn/schema/encoding/scale/transaction.hpp>
#include <altyn/schema/encoding/scale/treasury_state.hpp>
#include <altyn/schema/encoding/scale/wallet_state.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <iterator>
#include <scale/scale.hpp>

namespace altyn::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  altyn::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, altyn::schema::bytes_t& out);

  template <typename T>
  T decode(const altyn::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const altyn::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
altyn::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    altyn::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        altyn::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const altyn::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    altyn::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const altyn::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return decoded.value();
  } catch (const std::exception& ex) {
    spdlog::warn("Rejected malformed SCALE bytes: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace altyn::schema::encoding
