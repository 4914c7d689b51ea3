#include <chronicle/blake3/hash.hpp>
#include <chronicle/merkle/tree.hpp>

#include <algorithm>
#include <iterator>
#include <vector>

namespace chronicle::merkle {

namespace {

using level_t = std::vector<chronicle::schema::hash32_t>;

level_t next_level(const level_t& current) {
  auto next = level_t{};
  next.reserve((current.size() + 1) / 2);
  for (std::size_t i = 0; i < current.size(); i += 2) {
    const auto& left = current[i];
    const auto& right = (i + 1 < current.size()) ? current[i + 1] : current[i];
    next.push_back(chronicle::blake3::hash_pair(left, right));
  }
  return next;
}

}  // namespace

std::optional<chronicle::schema::root_t> root(const leaves_view_t& leaves) {
  if (leaves.empty()) {
    return std::nullopt;
  }
  auto level = level_t{std::begin(leaves), std::end(leaves)};
  while (level.size() > 1) {
    level = next_level(level);
  }
  return level.front();
}

std::optional<chronicle::schema::inclusion_proof_t> proof(
    const leaves_view_t& leaves,
    std::size_t index) {
  if (index >= leaves.size()) {
    return std::nullopt;
  }
  auto path = chronicle::schema::inclusion_proof_t{};
  auto level = level_t{std::begin(leaves), std::end(leaves)};
  while (level.size() > 1) {
    if ((index % 2) == 0) {
      const auto sibling = (index + 1 < level.size()) ? index + 1 : index;
      path.push_back(chronicle::schema::proof_step{
          .sibling = level[sibling],
          .side = chronicle::schema::proof_side_t::right});
    } else {
      path.push_back(chronicle::schema::proof_step{
          .sibling = level[index - 1],
          .side = chronicle::schema::proof_side_t::left});
    }
    level = next_level(level);
    index /= 2;
  }
  return path;
}

bool verify(const chronicle::schema::digest_t& leaf,
            const chronicle::schema::inclusion_proof_t& proof,
            const chronicle::schema::root_t& expected_root) {
  auto running = leaf;
  for (const auto& step : proof) {
    running = step.side == chronicle::schema::proof_side_t::right
                  ? chronicle::blake3::hash_pair(running, step.sibling)
                  : chronicle::blake3::hash_pair(step.sibling, running);
  }
  return running == expected_root;
}

std::optional<std::size_t> index_of(const leaves_view_t& leaves,
                                    const chronicle::schema::digest_t& leaf) {
  auto found = std::find(std::begin(leaves), std::end(leaves), leaf);
  if (found == std::end(leaves)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(std::begin(leaves), found));
}

}  // namespace chronicle::merkle
