#ifndef PMTORRENT_MERKLE_ERROR_HPP
#define PMTORRENT_MERKLE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pmtorrent::merkle {

enum class MerkleErrc {
  LeafCount,   // a level size is not a power of two
  InvalidIdx   // node index outside the tree
};

// Convert MerkleErrc to string for logging
const char* to_string(MerkleErrc code);

class MerkleError : public std::runtime_error {
public:
  MerkleError(MerkleErrc code, const std::string& message)
    : std::runtime_error(std::string("Merkle error (") + to_string(code) + "): " + message)
    , code_(code) {}

  MerkleErrc code() const { return code_; }

private:
  MerkleErrc code_;
};

} // namespace pmtorrent::merkle

#endif // PMTORRENT_MERKLE_ERROR_HPP
