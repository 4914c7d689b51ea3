#pragma once
#include <chronicle/schema/primitives.hpp>

namespace chronicle::blake3 {

chronicle::schema::hash32_t hash(const chronicle::schema::bytes_view_t& bytes);

/// BLAKE3(left || right), the interior node function of the batch tree.
chronicle::schema::hash32_t hash_pair(const chronicle::schema::hash32_t& left,
                                      const chronicle::schema::hash32_t& right);

}  // namespace chronicle::blake3
