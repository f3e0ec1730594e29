#ifndef RPIPE_CLIENT_PIPE_WRITER_HPP
#define RPIPE_CLIENT_PIPE_WRITER_HPP

#include <deque>
#include <istream>
#include <memory>
#include <string>
#include "client/transfer_stats.hpp"
#include "codec/stream_codec.hpp"
#include "config/pipe_config.hpp"
#include "crypto/crypto_box.hpp"
#include "network/transport.hpp"

namespace rpipe {
namespace client {

/**
 * Writer end of a pipe. Splits the input into chunk_size pieces, compresses
 * and seals each one, and appends them to the server strictly in order.
 *
 * A chunk is only emitted once more input follows it, so the piece that
 * close() flushes is always the one flagged is_last.
 */
class PipeWriter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PipeWriter(network::Transport& transport, const config::PipeConfig& config, std::string secret);
  ~PipeWriter();

  PipeWriter(const PipeWriter&) = delete;
  PipeWriter& operator=(const PipeWriter&) = delete;


  // ---- SESSION CONTROL ----
  // Creates a fresh session on the server and returns its id
  const SessionId& open();
  // Flushes the final chunk and seals the session. Safe to call again
  // after a transport failure; the final chunk is resent, not rebuilt.
  void close();


  // ---- DATA TRANSFER ----
  // Input is buffered even when sending fails; the next write() or close()
  // resends whatever the server has not accepted yet
  void write(const uint8_t* data, std::size_t size);
  void write(const std::string& data) { write(reinterpret_cast<const uint8_t*>(data.data()), data.size()); }
  // Reads the stream to EOF; does not close
  void write_stream(std::istream& input);


  // ---- GETTERS ----
  const SessionId& session_id() const { return session_id_; }
  Seq next_seq() const { return next_seq_; }
  bool is_open() const { return box_ != nullptr && !closed_; }
  bool is_closed() const { return closed_; }
  const TransferStats& stats() const { return stats_; }

private:
  // ---- PARAMETERS ----
  network::Transport& transport_;
  const config::PipeConfig config_;
  std::string secret_;

  SessionId session_id_;
  std::unique_ptr<crypto::CryptoBox> box_;
  std::unique_ptr<codec::Compressor> compressor_;

  // Input not yet cut into a chunk
  Bytes pending_;
  Seq next_seq_ = 0;
  // First chunk the server has not accepted yet
  Seq next_unsent_ = 0;
  bool closed_ = false;
  // Recently produced chunks, kept for resending after a sequence mismatch
  std::deque<store::Chunk> history_;
  TransferStats stats_;


  // ---- CHUNK PIPELINE ----
  // Compresses, seals and records the next chunk without sending it
  void seal_chunk(const uint8_t* data, std::size_t size, bool last);
  // Sends every chunk the server has not accepted yet
  void flush();
  // Sends history entries from `from` through the newest one
  void transmit(Seq from);
  bool final_produced() const;
  const store::Chunk& retained(Seq seq) const;

  void require_open(const char* operation) const;
};

} // namespace client
} // namespace rpipe

#endif // RPIPE_CLIENT_PIPE_WRITER_HPP
