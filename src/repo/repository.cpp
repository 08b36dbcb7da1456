#include "repo/repository.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace pmtorrent {
namespace repo {

namespace {

// Invalid indices mean there was nothing to find; anything else is a
// broken file.
RepoError to_repo_error(const file::FileError& e) {
  if (e.merkle_code() == merkle::MerkleErrc::InvalidIdx) {
    return RepoError(RepoErrc::DoesntExist, e.what());
  }
  return RepoError(RepoErrc::File, e.what());
}

} // namespace

//==============================================
// CORE OPERATIONS
//==============================================

void Repository::add(file::File file) {
  std::string hash = file.root().to_hex();
  BOOST_LOG_TRIVIAL(info) << "Repository: Adding file " << hash << " with " << file.size() << " pieces";

  files_.insert_or_assign(hash, std::move(file));
}

std::string Repository::add_from_path(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Repository: Loading file from path: " << path;

  // Open input file in binary mode so chunk bytes match the file exactly
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "Repository: Failed to open file: " << path;
    throw RepoError(RepoErrc::File, "Failed to open file: " + path);
  }

  try {
    file::File file = file::File::from_stream(input);
    std::string hash = file.root().to_hex();
    add(std::move(file));
    return hash;
  } catch (const file::FileError& e) {
    BOOST_LOG_TRIVIAL(error) << "Repository: Failed to load " << path << ": " << e.what();
    throw to_repo_error(e);
  }
}

std::vector<FileDescription> Repository::list() const {
  BOOST_LOG_TRIVIAL(debug) << "Repository: Listing " << files_.size() << " files";

  std::vector<FileDescription> out;
  out.reserve(files_.size());
  for (const auto& [hash, file] : files_) {
    out.push_back(FileDescription{hash, file.size()});
  }
  return out;
}

file::Piece Repository::get_piece(const std::string& hash, std::size_t idx) const {
  BOOST_LOG_TRIVIAL(debug) << "Repository: Piece " << idx << " requested for " << hash;

  const file::File* file = find(hash);
  if (!file) {
    BOOST_LOG_TRIVIAL(debug) << "Repository: Unknown file hash: " << hash;
    throw RepoError(RepoErrc::DoesntExist, "No file with hash " + hash);
  }

  try {
    auto [content, proof] = file->get_chunk(idx);
    return file::Piece{std::move(content), std::move(proof)};
  } catch (const file::FileError& e) {
    // A missing chunk index is an absent piece, not a broken file
    if (e.kind() == file::FileErrc::File) {
      throw RepoError(RepoErrc::DoesntExist,
                      "No piece " + std::to_string(idx) + " in file " + hash);
    }
    throw to_repo_error(e);
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Repository::contains(const std::string& hash) const {
  return files_.count(hash) > 0;
}

const file::File* Repository::find(const std::string& hash) const {
  auto it = files_.find(hash);
  if (it == files_.end()) {
    return nullptr;
  }
  return &it->second;
}

} // namespace repo
} // namespace pmtorrent
