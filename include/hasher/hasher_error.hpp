#ifndef PMTORRENT_HASHER_ERROR_HPP
#define PMTORRENT_HASHER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pmtorrent::hasher {

class HasherError : public std::runtime_error {
public:
  explicit HasherError(const std::string& message)
    : std::runtime_error("Hasher error: " + message) {}
};

} // namespace pmtorrent::hasher

#endif // PMTORRENT_HASHER_ERROR_HPP
