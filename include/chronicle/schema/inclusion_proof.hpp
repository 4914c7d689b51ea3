#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace chronicle::schema {

/// Which side of the running hash the sibling sits on.
enum class proof_side_t : uint8_t { left = 0, right = 1 };

struct proof_step final {
  hash32_t sibling{};
  proof_side_t side{proof_side_t::right};

  bool operator==(const proof_step&) const = default;
};

/// Leaf-to-root path. Empty for a single-member batch.
using inclusion_proof_t = std::vector<proof_step>;

}  // namespace chronicle::schema
