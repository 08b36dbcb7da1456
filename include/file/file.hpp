#ifndef PMTORRENT_FILE_FILE_HPP
#define PMTORRENT_FILE_FILE_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <utility>
#include <vector>
#include "hasher/sha256_hasher.hpp"
#include "merkle/merkle_tree.hpp"
#include "file/chunk.hpp"
#include "file/file_error.hpp"

namespace pmtorrent::file {

using Hash = hasher::Sha256Hash;
using ChunkTree = merkle::MerkleTree<hasher::Sha256Hasher>;
using Proof = ChunkTree::Proof;

// Hash of a filler leaf
inline constexpr Hash FILLER_HASH{};

// A chunk together with the proof linking it to its file's root
struct Piece {
  Chunk content;
  Proof proof;
};

// File content split into chunks and bound to a padded Merkle tree over
// them. A File is immutable once constructed; the root is its address.
class File {
public:
  // ---- CONSTRUCTION ----
  explicit File(const std::vector<uint8_t>& data);
  explicit File(const std::string& data);
  // Reads the whole stream incrementally
  static File from_stream(std::istream& input);


  // ---- QUERIES ----
  const Hash& root() const { return tree_.root(); }
  // Root a local verifier trusts
  Hash trusted_root() const { return tree_.nodes().back(); }
  // Number of real (non-filler) chunks
  std::size_t size() const { return chunks_.size(); }
  // Padded leaf count of the tree
  std::size_t leaf_count() const { return tree_.leaf_count(); }
  const ChunkTree& tree() const { return tree_; }


  // ---- PIECE EXTRACTION ----
  // Chunk at idx with its proof, throws FileError if idx is not a real chunk
  std::pair<Chunk, Proof> get_chunk(std::size_t idx) const;

private:
  explicit File(std::vector<Chunk> chunks);

  static ChunkTree build_tree(const std::vector<Chunk>& chunks);

  // ---- PARAMETERS ----
  std::vector<Chunk> chunks_;
  ChunkTree tree_;
};


// ---- VERIFICATION ----
// Leaf digest used by File: chunk bytes right-padded with zeros to CHUNK_BYTES
Hash digest_chunk(const hasher::Sha256Hasher& hasher, const uint8_t* data, std::size_t size);

// Rebuilds the root from one chunk's bytes and its proof. leaf_count is the
// file's chunk count or its padded leaf count.
Hash root_from_partial(const hasher::Sha256Hasher& hasher, const uint8_t* data, std::size_t size,
                       std::size_t leaf_idx, std::size_t leaf_count, const Proof& proof);

// True when piece reproduces trusted_root for a file of piece_count chunks.
// A malformed proof counts as a mismatch.
bool verify_piece(const Hash& trusted_root, const Piece& piece, std::size_t piece_count);

} // namespace pmtorrent::file

#endif // PMTORRENT_FILE_FILE_HPP
