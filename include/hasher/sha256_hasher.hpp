#ifndef PMTORRENT_HASHER_SHA256_HASHER_HPP
#define PMTORRENT_HASHER_SHA256_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include "hasher/digest.hpp"

namespace pmtorrent::hasher {

using Sha256Hash = Digest<32>;

// Hashes raw bytes with SHA-256 through OpenSSL EVP.
// Stateless, so one instance may be shared between threads.
class Sha256Hasher {
public:
  using hash_type = Sha256Hash;

  hash_type digest(const uint8_t* data, std::size_t size) const;
};

} // namespace pmtorrent::hasher

#endif // PMTORRENT_HASHER_SHA256_HASHER_HPP
