#ifndef PMTORRENT_FILE_CHUNKER_HPP
#define PMTORRENT_FILE_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "file/chunk.hpp"

namespace pmtorrent::file {

// Re-assembles fragments of any size into fixed-size chunks numbered from 0.
class ChunkAssembler {
public:
  // ---- CONSTRUCTOR ----
  explicit ChunkAssembler(std::size_t chunk_size = CHUNK_BYTES);


  // ---- ASSEMBLY ----
  // Appends a fragment and returns the chunks it completed
  std::vector<Chunk> ingest(const uint8_t* data, std::size_t size);
  // Returns the trailing partial chunk, if any. No ingest() is allowed afterwards.
  std::optional<Chunk> finish();


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }
  std::size_t chunks_emitted() const { return next_idx_; }
  std::size_t buffered() const { return buffer_.size(); }

private:
  // ---- PARAMETERS ----
  std::size_t chunk_size_;
  std::vector<uint8_t> buffer_;
  std::size_t next_idx_{0};
  bool finished_{false};
};

// Splits whole inputs into chunks. Every input form yields the same
// boundaries for the same content.
class Chunker {
public:
  explicit Chunker(std::size_t chunk_size = CHUNK_BYTES);

  std::vector<Chunk> split(const uint8_t* data, std::size_t size) const;
  std::vector<Chunk> split(const std::vector<uint8_t>& data) const;
  std::vector<Chunk> split(const std::string& data) const;
  // Reads the stream to EOF
  std::vector<Chunk> split(std::istream& input) const;

  std::size_t chunk_size() const { return chunk_size_; }

private:
  std::size_t chunk_size_;
  static constexpr std::size_t READ_BUFFER_SIZE = 4096;
};

} // namespace pmtorrent::file

#endif // PMTORRENT_FILE_CHUNKER_HPP
