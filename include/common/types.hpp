#ifndef RPIPE_COMMON_TYPES_HPP
#define RPIPE_COMMON_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rpipe {

// Raw binary buffer used for frames, ciphertext and key material
using Bytes = std::vector<uint8_t>;

// Opaque session token handed out by the server
using SessionId = std::string;

// Chunk sequence number, unique within a session
using Seq = uint64_t;

using Clock = std::chrono::steady_clock;

inline Bytes to_bytes(const std::string& s) {
  return Bytes(s.begin(), s.end());
}

inline std::string to_string(const Bytes& b) {
  return std::string(b.begin(), b.end());
}

} // namespace rpipe

#endif // RPIPE_COMMON_TYPES_HPP
