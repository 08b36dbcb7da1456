#include "file/file.hpp"
#include "file/chunker.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace pmtorrent::file {

//==============================================
// CONSTRUCTION
//==============================================

File::File(const std::vector<uint8_t>& data) : File(Chunker().split(data)) {}

File::File(const std::string& data) : File(Chunker().split(data)) {}

File File::from_stream(std::istream& input) {
  return File(Chunker().split(input));
}

File::File(std::vector<Chunk> chunks)
  : chunks_(std::move(chunks))
  , tree_(build_tree(chunks_)) {
  BOOST_LOG_TRIVIAL(info) << "File: Built file " << tree_.root() << " with " << chunks_.size()
                          << " chunks and " << tree_.leaf_count() << " leaves";
}

ChunkTree File::build_tree(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    BOOST_LOG_TRIVIAL(error) << "File: Refusing to build a file without data";
    throw FileError("No data to chunk");
  }

  hasher::Sha256Hasher hasher;
  try {
    return ChunkTree::build(hasher, chunks, merkle::LeafPolicy::Padded,
                            [&hasher](const Chunk& chunk) {
                              return digest_chunk(hasher, chunk.data().data(), chunk.size());
                            });
  } catch (const merkle::MerkleError& e) {
    BOOST_LOG_TRIVIAL(error) << "File: Tree construction failed: " << e.what();
    throw FileError(e);
  }
}


//==============================================
// PIECE EXTRACTION
//==============================================

std::pair<Chunk, Proof> File::get_chunk(std::size_t idx) const {
  if (idx >= chunks_.size()) {
    BOOST_LOG_TRIVIAL(debug) << "File: Chunk " << idx << " requested from file with "
                             << chunks_.size() << " chunks";
    throw FileError("No chunk at index " + std::to_string(idx));
  }

  const Chunk& chunk = chunks_[idx];
  try {
    return {chunk, tree_.get_proof(chunk.leaf_idx())};
  } catch (const merkle::MerkleError& e) {
    BOOST_LOG_TRIVIAL(error) << "File: Proof extraction failed for chunk " << idx << ": " << e.what();
    throw FileError(e);
  }
}


//==============================================
// VERIFICATION
//==============================================

Hash digest_chunk(const hasher::Sha256Hasher& hasher, const uint8_t* data, std::size_t size) {
  if (size >= CHUNK_BYTES) {
    return hasher.digest(data, size);
  }

  // Short chunks hash as if right-padded with zero bytes
  uint8_t padded[CHUNK_BYTES] = {};
  std::copy(data, data + size, padded);
  return hasher.digest(padded, CHUNK_BYTES);
}

Hash root_from_partial(const hasher::Sha256Hasher& hasher, const uint8_t* data, std::size_t size,
                       std::size_t leaf_idx, std::size_t leaf_count, const Proof& proof) {
  return merkle::root_from_leaf_hash(hasher, digest_chunk(hasher, data, size),
                                     leaf_idx, leaf_count, proof);
}

bool verify_piece(const Hash& trusted_root, const Piece& piece, std::size_t piece_count) {
  hasher::Sha256Hasher hasher;
  const Chunk& chunk = piece.content;

  try {
    Hash root = root_from_partial(hasher, chunk.data().data(), chunk.size(), chunk.leaf_idx(),
                                  piece_count, piece.proof);
    return root == trusted_root;
  } catch (const merkle::MerkleError& e) {
    BOOST_LOG_TRIVIAL(warning) << "File: Malformed piece " << chunk.leaf_idx() << ": " << e.what();
    return false;
  }
}

} // namespace pmtorrent::file
