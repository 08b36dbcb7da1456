#ifndef PMTORRENT_FILE_ERROR_HPP
#define PMTORRENT_FILE_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include "merkle/merkle_error.hpp"

namespace pmtorrent::file {

enum class FileErrc {
  Merkle,  // tree construction or proof lookup failed
  File     // no data, or no chunk at the requested index
};

inline const char* to_string(FileErrc kind) {
  switch (kind) {
    case FileErrc::Merkle: return "Merkle";
    case FileErrc::File:   return "File";
    default:               return "Unknown";
  }
}

class FileError : public std::runtime_error {
public:
  explicit FileError(const std::string& message)
    : std::runtime_error("File error: " + message)
    , kind_(FileErrc::File) {}

  // Wraps a tree error, keeping its code
  explicit FileError(const merkle::MerkleError& cause)
    : std::runtime_error(std::string("File error: ") + cause.what())
    , kind_(FileErrc::Merkle)
    , merkle_code_(cause.code()) {}

  FileErrc kind() const { return kind_; }
  // Set only when kind() is FileErrc::Merkle
  std::optional<merkle::MerkleErrc> merkle_code() const { return merkle_code_; }

private:
  FileErrc kind_;
  std::optional<merkle::MerkleErrc> merkle_code_;
};

} // namespace pmtorrent::file

#endif // PMTORRENT_FILE_ERROR_HPP
