#include "hasher/digest.hpp"
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace pmtorrent::hasher {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string encode_hex(const uint8_t* data, std::size_t size) {
  // Convert the raw bytes to a hexadecimal string
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

void decode_hex(const std::string& hex, uint8_t* out, std::size_t out_size) {
  if (hex.size() != out_size * 2) {
    BOOST_LOG_TRIVIAL(debug) << "Hasher: Rejecting hex string of length " << hex.size()
                             << " (expected " << out_size * 2 << ")";
    throw HasherError("Invalid hex length");
  }

  for (std::size_t i = 0; i < out_size; ++i) {
    int hi = hex_value(hex[2 * i]);
    int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      BOOST_LOG_TRIVIAL(debug) << "Hasher: Rejecting non-hex character at offset " << 2 * i;
      throw HasherError("Invalid hex character");
    }
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
}

} // namespace pmtorrent::hasher
