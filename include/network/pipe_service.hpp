#ifndef RPIPE_NETWORK_PIPE_SERVICE_HPP
#define RPIPE_NETWORK_PIPE_SERVICE_HPP

#include "network/message_frame.hpp"
#include "store/chunk_store.hpp"

namespace rpipe {
namespace network {

// Maps requests onto ChunkStore operations. Shared by every transport, so
// TCP and in-process clients see identical semantics.
class PipeService {
public:
  explicit PipeService(store::ChunkStore& store);

  Response handle(const Request& request);
  // Decodes, dispatches and encodes; malformed frames get a BAD_REQUEST reply
  Bytes handle_frame(const Bytes& frame);

  store::ChunkStore& store() { return store_; }

private:
  store::ChunkStore& store_;

  Response handle_open(const Request& request);
  Response handle_append(const Request& request);
  Response handle_fetch(const Request& request);
  Response handle_ack(const Request& request);

  // Returns an empty string when the chunk is well formed
  static std::string validate_chunk(const store::Chunk& chunk);
};

} // namespace network
} // namespace rpipe

#endif // RPIPE_NETWORK_PIPE_SERVICE_HPP
