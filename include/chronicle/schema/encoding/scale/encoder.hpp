#pragma once
#include <chronicle/common/critical.hpp>
#include <chronicle/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  chronicle::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      chronicle::common::critical("SCALE encoding failed");
    }
    return std::move(encoded.value());
  }

  template <typename T>
  std::optional<T> try_decode(const chronicle::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace chronicle::schema::encoding
