#ifndef PMTORRENT_HASHER_DIGEST_HPP
#define PMTORRENT_HASHER_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "hasher/hasher_error.hpp"

namespace pmtorrent::hasher {

// ---- HEX ENCODING ----
// Lowercase hex of a raw byte range
std::string encode_hex(const uint8_t* data, std::size_t size);
// Decodes exactly out_size bytes from hex, throws HasherError otherwise
void decode_hex(const std::string& hex, uint8_t* out, std::size_t out_size);


// Fixed-width digest value, compared byte for byte.
// A value-initialized Digest is all zero bytes.
template <std::size_t N>
class Digest {
public:
  static constexpr std::size_t SIZE = N;

  constexpr Digest() : bytes_{} {}
  explicit constexpr Digest(const std::array<uint8_t, N>& bytes) : bytes_(bytes) {}

  // Parses the hex form produced by to_hex()
  static Digest from_hex(const std::string& hex) {
    Digest d;
    decode_hex(hex, d.bytes_.data(), N);
    return d;
  }

  const uint8_t* data() const { return bytes_.data(); }
  constexpr std::size_t size() const { return N; }
  const std::array<uint8_t, N>& bytes() const { return bytes_; }

  std::string to_hex() const { return encode_hex(bytes_.data(), N); }

  bool is_zero() const {
    for (uint8_t b : bytes_) {
      if (b != 0) {
        return false;
      }
    }
    return true;
  }

  friend bool operator==(const Digest& a, const Digest& b) { return a.bytes_ == b.bytes_; }
  friend bool operator!=(const Digest& a, const Digest& b) { return !(a == b); }

  friend std::ostream& operator<<(std::ostream& os, const Digest& d) {
    return os << d.to_hex();
  }

private:
  std::array<uint8_t, N> bytes_;
};

} // namespace pmtorrent::hasher

#endif // PMTORRENT_HASHER_DIGEST_HPP
