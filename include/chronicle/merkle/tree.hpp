#pragma once

#include <chronicle/schema/inclusion_proof.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <span>

/// Batch aggregate: a binary Merkle tree over digests in submission order.
///
/// - Leaves are the digests themselves, unhashed.
/// - Interior node = BLAKE3(left || right).
/// - An odd trailing node at any level is paired with itself.
/// - One leaf: the root is that leaf. Zero leaves: no root.
///
/// External verifiers must reproduce exactly these rules. Because of the
/// odd-node duplication, [A, B, C] and [A, B, C, C] share a root; batches never
/// repeat a digest, and a colliding root is rejected by the anchor store.
namespace chronicle::merkle {

using leaves_view_t = std::span<const chronicle::schema::digest_t>;

std::optional<chronicle::schema::root_t> root(const leaves_view_t& leaves);

/// Sibling path for `leaves[index]`; std::nullopt when out of range.
std::optional<chronicle::schema::inclusion_proof_t> proof(
    const leaves_view_t& leaves,
    std::size_t index);

/// Fold `leaf` up through `proof` and compare with `expected_root`.
bool verify(const chronicle::schema::digest_t& leaf,
            const chronicle::schema::inclusion_proof_t& proof,
            const chronicle::schema::root_t& expected_root);

std::optional<std::size_t> index_of(const leaves_view_t& leaves,
                                    const chronicle::schema::digest_t& leaf);

}  // namespace chronicle::merkle
