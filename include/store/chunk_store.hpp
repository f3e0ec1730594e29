#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "config/pipe_config.hpp"
#include "session/pipe_session.hpp"
#include "store/chunk.hpp"

namespace rpipe {
namespace store {

/**
 * Process-wide table of pipe sessions and their buffered chunks.
 *
 * Each session has its own shared_mutex: append and close take it
 * exclusively, fetch/ack/attach/status take it shared so readers never
 * contend with each other. The table lock is never held while a session
 * lock is acquired.
 */
class ChunkStore {
public:
  using ClockFn = std::function<Clock::time_point()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkStore(const config::PipeConfig& config, ClockFn clock = &Clock::now);
  ~ChunkStore();

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;


  // ---- SESSION LIFECYCLE ----
  // Creates an OPEN session and returns its id. Repeating the open with the
  // same salt and verifier returns the live session instead of a new one.
  SessionId open_session(const Bytes& salt, const Bytes& verifier);
  std::optional<SessionHandshake> attach_session(const SessionId& id);
  // OPEN -> SEALED; SEALED and fully acked -> EXPIRED
  Status close_session(const SessionId& id);


  // ---- CHUNK OPERATIONS ----
  // May block up to append_wait when the session buffer is full
  AppendResult append(const Chunk& chunk);
  // Never blocks on data; NOT_YET_AVAILABLE when the writer is behind
  FetchResult fetch(const SessionId& id, Seq seq);
  // Reader consumed chunks 0..seq; they become evictable
  AckResult ack(const SessionId& id, Seq seq);


  // ---- MAINTENANCE ----
  // Expires sessions idle beyond the TTL, returns how many were removed
  std::size_t expire_sweep();


  // ---- QUERY OPERATIONS ----
  bool has_session(const SessionId& id) const;
  std::optional<SessionStatus> status(const SessionId& id);
  StoreStats stats() const;

private:
  struct SessionEntry {
    SessionEntry(SessionId id, Bytes salt, Bytes verifier, Clock::time_point now)
      : session(std::move(id), std::move(salt), std::move(verifier), now) {}

    mutable std::shared_mutex mutex;
    std::condition_variable_any space_available;
    session::PipeSession session;
    // chunks[i].seq == base_seq + i; hashes run parallel to chunks
    std::deque<Chunk> chunks;
    std::deque<std::string> hashes;
    Seq base_seq = 0;
    std::size_t buffered_bytes = 0;
  };
  using EntryPtr = std::shared_ptr<SessionEntry>;

  // ---- PARAMETERS ----
  const config::PipeConfig config_;
  ClockFn clock_;
  mutable std::shared_mutex table_mutex_;
  std::unordered_map<SessionId, EntryPtr> sessions_;
  // Hex salt -> session opened with it
  std::unordered_map<std::string, SessionId> salt_index_;
  std::atomic<uint64_t> expired_total_{0};


  // ---- UTILITY METHODS ----
  EntryPtr find(const SessionId& id) const;
  EntryPtr find_by_salt(const std::string& salt_key) const;
  // Removes the table entry if it still refers to `entry`
  void erase(const SessionId& id, const EntryPtr& entry);
  // Drops physically retained chunks the reader has acknowledged
  static void evict_acked(SessionEntry& entry);
  // Marks the session EXPIRED and releases its chunks; caller holds entry lock
  void expire_locked(SessionEntry& entry);
  static std::string content_hash(const Chunk& chunk);
};

} // namespace store
} // namespace rpipe
