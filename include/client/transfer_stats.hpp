#ifndef RPIPE_CLIENT_TRANSFER_STATS_HPP
#define RPIPE_CLIENT_TRANSFER_STATS_HPP

#include <cstdint>
#include <ostream>

namespace rpipe {
namespace client {

struct TransferStats {
  uint64_t chunks = 0;
  uint64_t plaintext_bytes = 0;
  // Ciphertext plus tag, excluding framing
  uint64_t wire_bytes = 0;
  uint64_t retries = 0;

  double compression_ratio() const {
    return wire_bytes == 0 ? 0.0 : static_cast<double>(plaintext_bytes) / static_cast<double>(wire_bytes);
  }
};

inline std::ostream& operator<<(std::ostream& os, const TransferStats& stats) {
  os << stats.chunks << " chunks, " << stats.plaintext_bytes << " bytes plaintext, "
     << stats.wire_bytes << " bytes on the wire, " << stats.retries << " retries";
  return os;
}

} // namespace client
} // namespace rpipe

#endif // RPIPE_CLIENT_TRANSFER_STATS_HPP
