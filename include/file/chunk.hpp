#ifndef PMTORRENT_FILE_CHUNK_HPP
#define PMTORRENT_FILE_CHUNK_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>
#include "merkle/merkle_tree.hpp"

namespace pmtorrent::file {

// Fixed size of every chunk except possibly the last one
inline constexpr std::size_t CHUNK_BYTES = 1024;

// Owned slice of a file plus its position among the file's leaves
class Chunk {
public:
  Chunk(std::vector<uint8_t> data, std::size_t leaf_idx)
    : data_(std::move(data)), leaf_idx_(leaf_idx) {}

  const std::vector<uint8_t>& data() const { return data_; }
  std::size_t leaf_idx() const { return leaf_idx_; }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  friend bool operator==(const Chunk& a, const Chunk& b) {
    return a.leaf_idx_ == b.leaf_idx_ && a.data_ == b.data_;
  }
  friend bool operator!=(const Chunk& a, const Chunk& b) { return !(a == b); }

private:
  std::vector<uint8_t> data_;
  std::size_t leaf_idx_;
};

// Raw chunk bytes, unpadded
inline merkle::ByteView leaf_bytes(const Chunk& chunk) {
  return {chunk.data().data(), chunk.size()};
}

} // namespace pmtorrent::file

#endif // PMTORRENT_FILE_CHUNK_HPP
