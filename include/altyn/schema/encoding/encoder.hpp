#pragma once
#include <altyn/schema/primitives.hpp>
#include <optional>
#include <span>

namespace altyn::schema::encoding {

// Encoders are selected at build time through a library tag. Only SCALE is
// wired up; records are persisted in that format.
template <typename Library>
struct encoder {
  template <typename T>
  altyn::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, altyn::schema::bytes_t& out);

  template <typename T>
  T decode(const altyn::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const altyn::schema::bytes_view_t& bytes);
};

}  // namespace altyn::schema::encoding
