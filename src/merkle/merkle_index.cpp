#include "merkle/merkle_tree.hpp"

namespace pmtorrent::merkle {

const char* to_string(MerkleErrc code) {
  switch (code) {
    case MerkleErrc::LeafCount:  return "LeafCount";
    case MerkleErrc::InvalidIdx: return "InvalidIdx";
    default:                     return "Unknown";
  }
}

//==============================================
// INDEX ARITHMETIC
//==============================================

bool is_pow_of_two(std::size_t n) {
  return n > 0 && (n & (n - 1)) == 0;
}

std::size_t next_pow2(std::size_t n) {
  std::size_t p = 1;
  while (p < n) {
    p <<= 1;
  }
  return p;
}

std::size_t sibling_index(std::size_t idx) {
  return idx % 2 == 0 ? idx + 1 : idx - 1;
}

std::size_t parent_index(std::size_t idx, std::size_t node_count) {
  return node_count - (node_count - idx - 1 + idx % 2) / 2;
}

std::size_t tree_height(std::size_t leaf_count) {
  std::size_t height = 0;
  while (leaf_count > 0) {
    ++height;
    leaf_count >>= 1;
  }
  return height;
}

} // namespace pmtorrent::merkle
