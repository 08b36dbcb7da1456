#ifndef PMTORRENT_MERKLE_TREE_HPP
#define PMTORRENT_MERKLE_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>
#include "merkle/merkle_error.hpp"

namespace pmtorrent::merkle {

// Leaf-count policy applied when a tree is built
enum class LeafPolicy {
  Strict,  // leaf count must already be a power of two
  Padded   // pad with filler hashes up to the next power of two
};


// ---- INDEX ARITHMETIC ----
// Layout: leaves occupy [0, L), each parent level follows contiguously,
// the root is the last node. A tree of L leaves has 2L - 1 nodes.
bool is_pow_of_two(std::size_t n);
// Smallest power of two >= n (1 for n == 0)
std::size_t next_pow2(std::size_t n);
std::size_t sibling_index(std::size_t idx);
// Parent of a non-root node in a tree of node_count nodes
std::size_t parent_index(std::size_t idx, std::size_t node_count);
// floor(log2(leaf_count)) + 1
std::size_t tree_height(std::size_t leaf_count);


// ---- LEAF SERIALIZATION ----
// Leaves are hashed over the bytes returned by leaf_bytes(leaf). Other leaf
// types provide an overload in their own namespace.
struct ByteView {
  const uint8_t* data;
  std::size_t size;
};

inline ByteView leaf_bytes(const std::vector<uint8_t>& leaf) {
  return {leaf.data(), leaf.size()};
}

inline ByteView leaf_bytes(const std::string& leaf) {
  return {reinterpret_cast<const uint8_t*>(leaf.data()), leaf.size()};
}


namespace detail {

// digest(left ++ right)
template <typename Hasher>
typename Hasher::hash_type digest_pair(const Hasher& hasher,
                                       const typename Hasher::hash_type& left,
                                       const typename Hasher::hash_type& right) {
  constexpr std::size_t width = Hasher::hash_type::SIZE;
  uint8_t buf[2 * width];
  std::memcpy(buf, left.data(), width);
  std::memcpy(buf + width, right.data(), width);
  return hasher.digest(buf, sizeof(buf));
}

} // namespace detail


// Binary hash tree stored as one flat array (see layout above).
// Hasher must expose hash_type and
//   hash_type digest(const uint8_t* data, std::size_t size) const;
// A built tree is immutable and safe to read from several threads.
template <typename Hasher>
class MerkleTree {
public:
  using hash_type = typename Hasher::hash_type;
  using Proof = std::vector<hash_type>;

  // ---- CONSTRUCTION ----
  // Digests every leaf with leaf_bytes() and builds the tree
  template <typename Leaf>
  static MerkleTree build(const Hasher& hasher, const std::vector<Leaf>& leaves,
                          LeafPolicy policy) {
    return build(hasher, leaves, policy, [&hasher](const Leaf& leaf) {
      ByteView bytes = leaf_bytes(leaf);
      return hasher.digest(bytes.data, bytes.size);
    });
  }

  // Same as above with a caller-supplied leaf digest
  template <typename Leaf, typename LeafDigest>
  static MerkleTree build(const Hasher& hasher, const std::vector<Leaf>& leaves,
                          LeafPolicy policy, LeafDigest digest_leaf) {
    std::vector<hash_type> level;
    level.reserve(leaves.size());
    for (const auto& leaf : leaves) {
      level.push_back(digest_leaf(leaf));
    }
    return from_leaf_hashes(hasher, std::move(level), policy);
  }

  static MerkleTree from_leaf_hashes(const Hasher& hasher, std::vector<hash_type> level,
                                     LeafPolicy policy) {
    if (level.empty()) {
      BOOST_LOG_TRIVIAL(error) << "Merkle: Cannot build a tree without leaves";
      throw MerkleError(MerkleErrc::LeafCount, "no leaves");
    }

    if (policy == LeafPolicy::Padded) {
      // Filler leaves are value-initialized (all zero) hashes
      level.resize(next_pow2(level.size()), hash_type{});
    } else if (!is_pow_of_two(level.size())) {
      BOOST_LOG_TRIVIAL(error) << "Merkle: Strict tree rejected " << level.size() << " leaves";
      throw MerkleError(MerkleErrc::LeafCount,
                        std::to_string(level.size()) + " leaves is not a power of two");
    }

    std::vector<hash_type> nodes;
    nodes.reserve(2 * level.size() - 1);

    // Every level has half the nodes of the one below it
    while (level.size() > 1) {
      std::vector<hash_type> next = build_inner_level(hasher, level);
      nodes.insert(nodes.end(), level.begin(), level.end());
      level = std::move(next);
    }

    // Append the root skipped by the loop
    nodes.push_back(level.front());

    BOOST_LOG_TRIVIAL(trace) << "Merkle: Built tree with " << nodes.size() << " nodes";
    return MerkleTree(std::move(nodes));
  }


  // ---- QUERIES ----
  const std::vector<hash_type>& nodes() const { return nodes_; }
  std::size_t size() const { return nodes_.size(); }
  const hash_type& root() const { return nodes_.back(); }
  std::size_t leaf_count() const { return (nodes_.size() + 1) / 2; }
  std::size_t height() const { return tree_height(leaf_count()); }


  // ---- NAVIGATION ----
  std::pair<hash_type, std::size_t> sibling_of(std::size_t idx) const {
    if (idx >= nodes_.size()) {
      throw MerkleError(MerkleErrc::InvalidIdx, "node " + std::to_string(idx) + " out of range");
    }
    std::size_t s_idx = sibling_index(idx);
    if (s_idx >= nodes_.size()) {
      throw MerkleError(MerkleErrc::InvalidIdx, "node " + std::to_string(idx) + " has no sibling");
    }
    return {nodes_[s_idx], s_idx};
  }

  std::pair<hash_type, std::size_t> parent_of(std::size_t idx) const {
    if (idx + 1 >= nodes_.size()) {
      throw MerkleError(MerkleErrc::InvalidIdx, "node " + std::to_string(idx) + " has no parent");
    }
    std::size_t p_idx = parent_index(idx, nodes_.size());
    return {nodes_[p_idx], p_idx};
  }

  // Sibling hashes from the leaf level up to, not including, the root
  Proof get_proof(std::size_t leaf_idx) const {
    if (leaf_idx >= leaf_count()) {
      BOOST_LOG_TRIVIAL(debug) << "Merkle: Proof requested for leaf " << leaf_idx
                               << " of " << leaf_count();
      throw MerkleError(MerkleErrc::InvalidIdx, "leaf " + std::to_string(leaf_idx) + " out of range");
    }

    Proof proof;
    proof.reserve(height() - 1);

    std::size_t idx = leaf_idx;
    for (std::size_t level = 0; level + 1 < height(); ++level) {
      auto [s_hash, s_idx] = sibling_of(idx);
      proof.push_back(s_hash);
      idx = parent_of(s_idx).second;
    }
    return proof;
  }

private:
  explicit MerkleTree(std::vector<hash_type> nodes) : nodes_(std::move(nodes)) {}

  static std::vector<hash_type> build_inner_level(const Hasher& hasher,
                                                  const std::vector<hash_type>& previous) {
    if (!is_pow_of_two(previous.size())) {
      throw MerkleError(MerkleErrc::LeafCount,
                        "level of " + std::to_string(previous.size()) + " nodes");
    }

    std::vector<hash_type> level;
    level.reserve(previous.size() / 2);
    for (std::size_t i = 0; i < previous.size(); i += 2) {
      level.push_back(detail::digest_pair(hasher, previous[i], previous[i + 1]));
    }
    return level;
  }

  std::vector<hash_type> nodes_;
};


// ---- PARTIAL ROOT RECONSTRUCTION ----
// Folds a proof over an already digested leaf. leaf_count may be the real
// leaf count or the padded one; it is rounded up to a power of two. The node
// index is advanced with parent_index() at every level, so even and odd
// positions combine in the same order as construction.
template <typename Hasher>
typename Hasher::hash_type root_from_leaf_hash(const Hasher& hasher,
                                               typename Hasher::hash_type leaf_hash,
                                               std::size_t leaf_idx,
                                               std::size_t leaf_count,
                                               const std::vector<typename Hasher::hash_type>& proof) {
  if (leaf_count == 0) {
    throw MerkleError(MerkleErrc::InvalidIdx, "leaf " + std::to_string(leaf_idx) + " of 0");
  }
  leaf_count = next_pow2(leaf_count);
  if (leaf_idx >= leaf_count) {
    throw MerkleError(MerkleErrc::InvalidIdx,
                      "leaf " + std::to_string(leaf_idx) + " of " + std::to_string(leaf_count));
  }
  if (proof.size() + 1 != tree_height(leaf_count)) {
    throw MerkleError(MerkleErrc::InvalidIdx,
                      "proof of " + std::to_string(proof.size()) + " hashes for "
                      + std::to_string(leaf_count) + " leaves");
  }

  const std::size_t node_count = 2 * leaf_count - 1;
  typename Hasher::hash_type acc = std::move(leaf_hash);
  std::size_t idx = leaf_idx;

  for (const auto& sibling : proof) {
    if (idx % 2 == 0) {
      acc = detail::digest_pair(hasher, acc, sibling);
    } else {
      acc = detail::digest_pair(hasher, sibling, acc);
    }
    idx = parent_index(idx, node_count);
  }
  return acc;
}

template <typename Hasher, typename Leaf>
typename Hasher::hash_type root_from_partial(const Hasher& hasher, const Leaf& leaf,
                                             std::size_t leaf_idx, std::size_t leaf_count,
                                             const std::vector<typename Hasher::hash_type>& proof) {
  ByteView bytes = leaf_bytes(leaf);
  return root_from_leaf_hash(hasher, hasher.digest(bytes.data, bytes.size),
                             leaf_idx, leaf_count, proof);
}

} // namespace pmtorrent::merkle

#endif // PMTORRENT_MERKLE_TREE_HPP
