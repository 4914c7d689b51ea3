#include <blake3.h>
#include <chronicle/blake3/hash.hpp>

#include <initializer_list>

namespace {

chronicle::schema::hash32_t digest_of(
    std::initializer_list<chronicle::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  auto output = chronicle::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<decltype(output)>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

namespace chronicle::blake3 {

chronicle::schema::hash32_t hash(const chronicle::schema::bytes_view_t& bytes) {
  return digest_of({bytes});
}

chronicle::schema::hash32_t hash_pair(
    const chronicle::schema::hash32_t& left,
    const chronicle::schema::hash32_t& right) {
  return digest_of({chronicle::schema::bytes_view_t{left},
                    chronicle::schema::bytes_view_t{right}});
}

}  // namespace chronicle::blake3
