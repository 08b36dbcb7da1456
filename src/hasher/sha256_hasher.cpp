#include "hasher/sha256_hasher.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace pmtorrent::hasher {

//==============================================
// HASHING
//==============================================

Sha256Hasher::hash_type Sha256Hasher::digest(const uint8_t* data, std::size_t size) const {
  std::array<uint8_t, hash_type::SIZE> out{};
  unsigned int out_len = 0;

  // One-shot digest, no context is kept between calls
  if (!EVP_Digest(data, size, out.data(), &out_len, EVP_sha256(), nullptr)
      || out_len != hash_type::SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Failed to compute SHA-256 of " << size << " bytes";
    throw HasherError("Failed to compute SHA-256 digest");
  }

  return hash_type(out);
}

} // namespace pmtorrent::hasher
