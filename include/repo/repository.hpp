#ifndef PMTORRENT_REPO_REPOSITORY_HPP
#define PMTORRENT_REPO_REPOSITORY_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "file/file.hpp"

namespace pmtorrent {
namespace repo {

// One catalog entry as reported by list()
struct FileDescription {
  std::string hash;
  std::size_t pieces;
};

// Catalog of Files keyed by the lowercase hex of their root hash.
// Reads (list, get_piece, find, contains) may run concurrently with each
// other; every add must happen before the repository is shared.
class Repository {
public:

  // ---- CORE OPERATIONS ----
  // Stores file under its own root hash, replacing identical content
  void add(file::File file);
  // Reads a file from disk and adds it, returns its hash
  std::string add_from_path(const std::string& path);
  // Returns one entry per stored file, in no particular order
  std::vector<FileDescription> list() const;
  // Chunk idx of the file with the given hash, plus its proof
  file::Piece get_piece(const std::string& hash, std::size_t idx) const;


  // ---- QUERY OPERATIONS ----
  bool contains(const std::string& hash) const;
  // Null when hash is unknown
  const file::File* find(const std::string& hash) const;
  std::size_t size() const { return files_.size(); }

private:
  // ---- PARAMETERS ----
  std::unordered_map<std::string, file::File> files_;
};

enum class RepoErrc {
  DoesntExist,  // unknown hash or chunk index
  File          // the file itself is unusable
};

inline const char* to_string(RepoErrc kind) {
  switch (kind) {
    case RepoErrc::DoesntExist: return "DoesntExist";
    case RepoErrc::File:        return "File";
    default:                    return "Unknown";
  }
}

class RepoError : public std::runtime_error {
public:
  RepoError(RepoErrc kind, const std::string& message)
    : std::runtime_error("Repository: " + message), kind_(kind) {}

  RepoErrc kind() const { return kind_; }

private:
  RepoErrc kind_;
};

} // namespace repo
} // namespace pmtorrent

#endif // PMTORRENT_REPO_REPOSITORY_HPP
