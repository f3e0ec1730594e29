#ifndef RPIPE_CLIENT_PIPE_READER_HPP
#define RPIPE_CLIENT_PIPE_READER_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include "client/transfer_stats.hpp"
#include "codec/stream_codec.hpp"
#include "config/pipe_config.hpp"
#include "crypto/crypto_box.hpp"
#include "network/transport.hpp"

namespace rpipe {
namespace client {

/**
 * Reader end of a pipe. Yields plaintext chunk by chunk in sequence order,
 * acknowledging each one after it decrypted and decompressed cleanly.
 * Single pass: decompression state cannot be rebuilt once a chunk is acked.
 */
class PipeReader {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PipeReader(network::Transport& transport, const config::PipeConfig& config,
             std::string secret, SessionId session_id);

  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;


  // ---- SESSION CONTROL ----
  // Fetches the handshake and checks the secret; next() calls it if needed.
  // Throws AuthError when the secret does not match the writer's.
  void attach();


  // ---- DATA TRANSFER ----
  // Next chunk of plaintext; false once the stream has ended. The final
  // chunk may be empty. After a failure the same chunk is retried, so
  // calling next() again never skips data.
  bool next(std::string& out);
  // Drains the whole stream into `output`
  void read_stream(std::ostream& output);


  // ---- GETTERS ----
  const SessionId& session_id() const { return session_id_; }
  Seq next_seq() const { return next_seq_; }
  bool finished() const { return finished_; }
  const TransferStats& stats() const { return stats_; }

private:
  // Decoded chunk waiting for its ack to go through
  struct HeldChunk {
    Seq seq;
    bool is_last;
    Bytes plaintext;
    std::size_t wire_bytes;
  };

  // ---- PARAMETERS ----
  network::Transport& transport_;
  const config::PipeConfig config_;
  std::string secret_;
  const SessionId session_id_;

  std::unique_ptr<crypto::CryptoBox> box_;
  codec::Decompressor decompressor_;
  Seq next_seq_ = 0;
  bool finished_ = false;
  std::optional<HeldChunk> held_;
  TransferStats stats_;


  // ---- CHUNK PIPELINE ----
  // Polls until chunk next_seq_ is available or read_idle_timeout elapses
  store::Chunk fetch_next();
  // Decrypts with one re-fetch per retry attempt on tag failure
  Bytes open_chunk(store::Chunk& chunk);
  void acknowledge(Seq seq);
  // Releases the drained session; failures are logged, not thrown
  void finish();
};

} // namespace client
} // namespace rpipe

#endif // RPIPE_CLIENT_PIPE_READER_HPP
