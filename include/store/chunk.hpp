#pragma once

#include <cstdint>
#include <optional>
#include "common/status.hpp"
#include "common/types.hpp"
#include "session/pipe_session.hpp"

namespace rpipe {
namespace store {

// Sequence-numbered unit of compressed, encrypted plaintext
struct Chunk {
  SessionId session_id;
  Seq seq = 0;
  Bytes ciphertext;
  Bytes tag;
  uint32_t plaintext_len = 0;
  uint32_t compressed_len = 0;
  bool is_last = false;

  std::size_t size_bytes() const { return ciphertext.size() + tag.size(); }
};

struct AppendResult {
  Status status = Status::OK;
  // next_write_seq after the call; the resync point on SEQUENCE_MISMATCH
  Seq expected = 0;
};

struct FetchResult {
  Status status = Status::OK;
  std::optional<Chunk> chunk;
};

struct AckResult {
  Status status = Status::OK;
  Seq expected = 0;
};

// Handshake parameters a reader needs to derive the session key
struct SessionHandshake {
  Bytes salt;
  Bytes verifier;
  session::SessionState state = session::SessionState::OPEN;
  Seq next_write_seq = 0;
};

struct SessionStatus {
  session::SessionState state = session::SessionState::OPEN;
  Seq next_write_seq = 0;
  Seq acked_count = 0;
  uint64_t buffered_chunks = 0;
  uint64_t buffered_bytes = 0;
  uint64_t age_ms = 0;
  uint64_t idle_ms = 0;
};

struct StoreStats {
  uint64_t sessions = 0;
  uint64_t buffered_chunks = 0;
  uint64_t buffered_bytes = 0;
  uint64_t expired_total = 0;
};

} // namespace store
} // namespace rpipe
