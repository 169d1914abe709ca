#include <blake3.h>
#include <altyn/blake3/hash.hpp>

namespace altyn::blake3 {

altyn::schema::hash32_t hash(const altyn::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = altyn::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

altyn::schema::hash32_t chain(const altyn::schema::hash32_t& previous,
                              const altyn::schema::bytes_view_t& payload) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous.data(), previous.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  auto output = altyn::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace altyn::blake3
