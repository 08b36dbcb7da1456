#include "file/chunker.hpp"
#include "file/file_error.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace pmtorrent::file {

//==============================================
// CHUNK ASSEMBLER
//==============================================

ChunkAssembler::ChunkAssembler(std::size_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw FileError("Chunk size must be positive");
  }
  buffer_.reserve(chunk_size_);
}

std::vector<Chunk> ChunkAssembler::ingest(const uint8_t* data, std::size_t size) {
  if (finished_) {
    throw std::logic_error("Cannot ingest data after finish() has been called.");
  }

  std::vector<Chunk> completed;
  while (size > 0) {
    // Top up the pending chunk with as much of the fragment as fits
    std::size_t take = std::min(size, chunk_size_ - buffer_.size());
    buffer_.insert(buffer_.end(), data, data + take);
    data += take;
    size -= take;

    if (buffer_.size() == chunk_size_) {
      completed.emplace_back(std::move(buffer_), next_idx_++);
      buffer_ = std::vector<uint8_t>();
      buffer_.reserve(chunk_size_);
    }
  }
  return completed;
}

std::optional<Chunk> ChunkAssembler::finish() {
  finished_ = true;
  if (buffer_.empty()) {
    return std::nullopt;
  }

  Chunk tail(std::move(buffer_), next_idx_++);
  buffer_ = std::vector<uint8_t>();
  return tail;
}


//==============================================
// CHUNKER
//==============================================

Chunker::Chunker(std::size_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw FileError("Chunk size must be positive");
  }
}

std::vector<Chunk> Chunker::split(const uint8_t* data, std::size_t size) const {
  std::vector<Chunk> chunks;
  chunks.reserve((size + chunk_size_ - 1) / chunk_size_);

  for (std::size_t offset = 0, idx = 0; offset < size; offset += chunk_size_, ++idx) {
    std::size_t len = std::min(chunk_size_, size - offset);
    chunks.emplace_back(std::vector<uint8_t>(data + offset, data + offset + len), idx);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << size << " bytes into " << chunks.size() << " chunks";
  return chunks;
}

std::vector<Chunk> Chunker::split(const std::vector<uint8_t>& data) const {
  return split(data.data(), data.size());
}

std::vector<Chunk> Chunker::split(const std::string& data) const {
  return split(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<Chunk> Chunker::split(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Invalid input stream";
    throw FileError("Invalid input stream");
  }

  ChunkAssembler assembler(chunk_size_);
  std::vector<Chunk> chunks;
  char buffer[READ_BUFFER_SIZE];
  std::size_t total_bytes = 0;

  auto consume = [&](std::streamsize count) {
    auto done = assembler.ingest(reinterpret_cast<const uint8_t*>(buffer),
                                 static_cast<std::size_t>(count));
    std::move(done.begin(), done.end(), std::back_inserter(chunks));
    total_bytes += static_cast<std::size_t>(count);
  };

  // Read input stream in blocks; short reads are re-assembled into chunks
  while (input.read(buffer, sizeof(buffer))) {
    consume(input.gcount());
  }

  // Handle final partial block if present
  if (input.gcount() > 0) {
    consume(input.gcount());
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Stream failed after " << total_bytes << " bytes";
    throw FileError("Failed to read input stream");
  }

  if (auto tail = assembler.finish()) {
    chunks.push_back(std::move(*tail));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Read " << total_bytes << " bytes into " << chunks.size() << " chunks";
  return chunks;
}

} // namespace pmtorrent::file
