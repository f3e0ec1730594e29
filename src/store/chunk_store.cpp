#include "store/chunk_store.hpp"
#include "crypto/digest.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>
#include <mutex>
#include <vector>

namespace rpipe {
namespace store {

using session::SessionState;

namespace {

uint64_t to_millis(Clock::duration d) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
  return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkStore::ChunkStore(const config::PipeConfig& config, ClockFn clock)
  : config_(config)
  , clock_(std::move(clock)) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Initialized with capacity " << config_.buffer_capacity
                          << " chunks per session and TTL " << config_.session_ttl.count() << "s";
}

ChunkStore::~ChunkStore() {
  std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Releasing " << sessions_.size() << " sessions";
  sessions_.clear();
  salt_index_.clear();
}

//==============================================
// SESSION LIFECYCLE
//==============================================

SessionId ChunkStore::open_session(const Bytes& salt, const Bytes& verifier) {
  const std::string salt_key = crypto::to_hex(salt.data(), salt.size());

  // Salts are random per open, so a known salt means the reply to an earlier
  // open was lost and the client is retrying
  if (EntryPtr existing = find_by_salt(salt_key)) {
    std::shared_lock<std::shared_mutex> lock(existing->mutex);
    if (!existing->session.is_terminal() && existing->session.verifier() == verifier) {
      existing->session.touch(clock_());
      BOOST_LOG_TRIVIAL(debug) << "Chunk store: Repeated open of session " << existing->session.id();
      return existing->session.id();
    }
  }

  const SessionId id = crypto::random_hex(16);
  auto entry = std::make_shared<SessionEntry>(id, salt, verifier, clock_());

  {
    std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
    sessions_.emplace(id, entry);
    salt_index_[salt_key] = id;
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Opened session " << id;
  return id;
}

std::optional<SessionHandshake> ChunkStore::attach_session(const SessionId& id) {
  EntryPtr entry = find(id);
  if (!entry) {
    return std::nullopt;
  }

  std::shared_lock<std::shared_mutex> lock(entry->mutex);
  if (entry->session.is_terminal()) {
    return std::nullopt;
  }
  entry->session.touch(clock_());

  SessionHandshake handshake;
  handshake.salt = entry->session.salt();
  handshake.verifier = entry->session.verifier();
  handshake.state = entry->session.get_state();
  handshake.next_write_seq = entry->session.next_write_seq();
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Reader attached to session " << id;
  return handshake;
}

Status ChunkStore::close_session(const SessionId& id) {
  EntryPtr entry = find(id);
  if (!entry) {
    return Status::SESSION_NOT_FOUND;
  }

  bool expired = false;
  {
    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    auto& session = entry->session;

    switch (session.get_state()) {
      case SessionState::EXPIRED:
        return Status::SESSION_NOT_FOUND;

      case SessionState::OPEN:
        session.touch(clock_());
        session.transition_to(SessionState::SEALED);
        BOOST_LOG_TRIVIAL(info) << "Chunk store: Session " << id << " sealed by close at seq "
                                << session.next_write_seq();
        return Status::OK;

      case SessionState::SEALED:
        if (!session.fully_acked()) {
          session.touch(clock_());
          BOOST_LOG_TRIVIAL(debug) << "Chunk store: Close on session " << id
                                   << " with undelivered chunks, keeping it";
          return Status::OK;
        }
        expire_locked(*entry);
        expired = true;
        break;
    }
  }

  if (expired) {
    erase(id, entry);
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Session " << id << " completed and released";
  }
  return Status::OK;
}

//==============================================
// CHUNK OPERATIONS
//==============================================

AppendResult ChunkStore::append(const Chunk& chunk) {
  EntryPtr entry = find(chunk.session_id);
  if (!entry) {
    return {Status::SESSION_NOT_FOUND, 0};
  }

  const std::string hash = content_hash(chunk);
  std::unique_lock<std::shared_mutex> lock(entry->mutex);
  auto& session = entry->session;
  bool waited = false;

  for (;;) {
    if (session.is_terminal()) {
      return {Status::SESSION_NOT_FOUND, 0};
    }
    session.touch(clock_());
    evict_acked(*entry);

    const Seq next = session.next_write_seq();

    // Retry of a chunk that already made it: replay the ack or flag the conflict
    if (chunk.seq < next) {
      if (chunk.seq < entry->base_seq) {
        BOOST_LOG_TRIVIAL(debug) << "Chunk store: Duplicate of evicted chunk " << chunk.seq
                                 << " in session " << chunk.session_id;
        return {Status::DUPLICATE, next};
      }
      const std::string& stored = entry->hashes[chunk.seq - entry->base_seq];
      if (stored == hash) {
        BOOST_LOG_TRIVIAL(debug) << "Chunk store: Duplicate chunk " << chunk.seq
                                 << " in session " << chunk.session_id;
        return {Status::DUPLICATE, next};
      }
      BOOST_LOG_TRIVIAL(error) << "Chunk store: Conflicting content for chunk " << chunk.seq
                               << " in session " << chunk.session_id;
      return {Status::SEQUENCE_CONFLICT, next};
    }

    if (session.get_state() == SessionState::SEALED) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Append of chunk " << chunk.seq
                                 << " to sealed session " << chunk.session_id;
      return {Status::SESSION_SEALED, next};
    }

    if (chunk.seq != next) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Sequence mismatch in session " << chunk.session_id
                                 << ": got " << chunk.seq << ", expected " << next;
      return {Status::SEQUENCE_MISMATCH, next};
    }

    const Seq unacked = next - session.acked_count();
    if (unacked < config_.buffer_capacity) {
      break;
    }

    if (waited) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Session " << chunk.session_id << " full with "
                                 << unacked << " unacked chunks";
      return {Status::STORE_FULL, next};
    }

    BOOST_LOG_TRIVIAL(debug) << "Chunk store: Session " << chunk.session_id
                             << " at capacity, waiting for reader";
    entry->space_available.wait_for(lock, config_.append_wait, [&session, this] {
      return session.is_terminal() ||
             session.next_write_seq() - session.acked_count() < config_.buffer_capacity;
    });
    waited = true;
  }

  entry->chunks.push_back(chunk);
  entry->hashes.push_back(hash);
  entry->buffered_bytes += chunk.size_bytes();
  session.advance_write_seq();

  if (chunk.is_last) {
    session.transition_to(SessionState::SEALED);
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Accepted chunk " << chunk.seq << " (" << chunk.size_bytes()
                           << " bytes) in session " << chunk.session_id
                           << (chunk.is_last ? ", end of stream" : "");
  return {Status::ACCEPTED, session.next_write_seq()};
}

FetchResult ChunkStore::fetch(const SessionId& id, Seq seq) {
  FetchResult result;
  EntryPtr entry = find(id);
  if (!entry) {
    result.status = Status::SESSION_NOT_FOUND;
    return result;
  }

  std::shared_lock<std::shared_mutex> lock(entry->mutex);
  const auto& session = entry->session;
  if (session.is_terminal()) {
    result.status = Status::SESSION_NOT_FOUND;
    return result;
  }
  entry->session.touch(clock_());

  if (seq < session.acked_count() || seq < entry->base_seq) {
    result.status = Status::EVICTED;
    return result;
  }

  if (seq >= session.next_write_seq()) {
    // A sealed session will never produce this chunk
    result.status = session.get_state() == SessionState::SEALED
                      ? Status::SESSION_SEALED
                      : Status::NOT_YET_AVAILABLE;
    return result;
  }

  result.status = Status::OK;
  result.chunk = entry->chunks[seq - entry->base_seq];
  BOOST_LOG_TRIVIAL(trace) << "Chunk store: Served chunk " << seq << " of session " << id;
  return result;
}

AckResult ChunkStore::ack(const SessionId& id, Seq seq) {
  EntryPtr entry = find(id);
  if (!entry) {
    return {Status::SESSION_NOT_FOUND, 0};
  }

  {
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    auto& session = entry->session;
    if (session.is_terminal()) {
      return {Status::SESSION_NOT_FOUND, 0};
    }
    session.touch(clock_());

    if (seq >= session.next_write_seq()) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Ack of unwritten chunk " << seq
                                 << " in session " << id;
      return {Status::SEQUENCE_MISMATCH, session.next_write_seq()};
    }
    session.record_ack(seq);
    BOOST_LOG_TRIVIAL(trace) << "Chunk store: Session " << id << " acked through " << seq;
  }

  entry->space_available.notify_all();
  return {Status::OK, seq + 1};
}

//==============================================
// MAINTENANCE
//==============================================

std::size_t ChunkStore::expire_sweep() {
  std::vector<std::pair<SessionId, EntryPtr>> candidates;
  {
    std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
    candidates.assign(sessions_.begin(), sessions_.end());
  }

  std::size_t removed = 0;
  const auto now = clock_();
  for (auto& [id, entry] : candidates) {
    {
      std::unique_lock<std::shared_mutex> lock(entry->mutex);
      if (entry->session.is_terminal() || !entry->session.idle_beyond(now, config_.session_ttl)) {
        continue;
      }
      BOOST_LOG_TRIVIAL(info) << "Chunk store: Session " << id << " idle beyond TTL in state "
                              << entry->session.get_state() << ", expiring";
      expire_locked(*entry);
    }
    erase(id, entry);
    ++removed;
  }

  if (removed > 0) {
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Sweep expired " << removed << " sessions";
  }
  return removed;
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkStore::has_session(const SessionId& id) const {
  return find(id) != nullptr;
}

std::optional<SessionStatus> ChunkStore::status(const SessionId& id) {
  EntryPtr entry = find(id);
  if (!entry) {
    return std::nullopt;
  }

  std::shared_lock<std::shared_mutex> lock(entry->mutex);
  const auto& session = entry->session;
  if (session.is_terminal()) {
    return std::nullopt;
  }

  const auto now = clock_();
  SessionStatus status;
  status.state = session.get_state();
  status.next_write_seq = session.next_write_seq();
  status.acked_count = session.acked_count();
  status.buffered_chunks = entry->chunks.size();
  status.buffered_bytes = entry->buffered_bytes;
  status.age_ms = to_millis(now - session.created_at());
  status.idle_ms = to_millis(now - session.last_activity_at());
  return status;
}

StoreStats ChunkStore::stats() const {
  std::vector<EntryPtr> entries;
  {
    std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
    entries.reserve(sessions_.size());
    for (const auto& [id, entry] : sessions_) {
      entries.push_back(entry);
    }
  }

  StoreStats stats;
  for (const auto& entry : entries) {
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    if (entry->session.is_terminal()) {
      continue;
    }
    ++stats.sessions;
    stats.buffered_chunks += entry->chunks.size();
    stats.buffered_bytes += entry->buffered_bytes;
  }
  stats.expired_total = expired_total_.load();
  return stats;
}

//==============================================
// UTILITY METHODS
//==============================================

ChunkStore::EntryPtr ChunkStore::find(const SessionId& id) const {
  std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
  auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : it->second;
}

ChunkStore::EntryPtr ChunkStore::find_by_salt(const std::string& salt_key) const {
  std::shared_lock<std::shared_mutex> table_lock(table_mutex_);
  auto salt_it = salt_index_.find(salt_key);
  if (salt_it == salt_index_.end()) {
    return nullptr;
  }
  auto it = sessions_.find(salt_it->second);
  return it == sessions_.end() ? nullptr : it->second;
}

void ChunkStore::erase(const SessionId& id, const EntryPtr& entry) {
  const Bytes& salt = entry->session.salt();
  const std::string salt_key = crypto::to_hex(salt.data(), salt.size());

  std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
  auto it = sessions_.find(id);
  if (it != sessions_.end() && it->second == entry) {
    sessions_.erase(it);
  }
  auto salt_it = salt_index_.find(salt_key);
  if (salt_it != salt_index_.end() && salt_it->second == id) {
    salt_index_.erase(salt_it);
  }
}

void ChunkStore::evict_acked(SessionEntry& entry) {
  const Seq acked = entry.session.acked_count();
  while (!entry.chunks.empty() && entry.base_seq < acked) {
    entry.buffered_bytes -= entry.chunks.front().size_bytes();
    entry.chunks.pop_front();
    entry.hashes.pop_front();
    ++entry.base_seq;
  }
}

void ChunkStore::expire_locked(SessionEntry& entry) {
  entry.session.transition_to(SessionState::EXPIRED);
  entry.chunks.clear();
  entry.hashes.clear();
  entry.buffered_bytes = 0;
  expired_total_.fetch_add(1);
  entry.space_available.notify_all();
}

std::string ChunkStore::content_hash(const Chunk& chunk) {
  Bytes meta(1 + 2 * sizeof(uint32_t));
  meta[0] = chunk.is_last ? 1 : 0;
  const uint32_t plaintext_len = boost::endian::native_to_big(chunk.plaintext_len);
  const uint32_t compressed_len = boost::endian::native_to_big(chunk.compressed_len);
  std::memcpy(meta.data() + 1, &plaintext_len, sizeof(plaintext_len));
  std::memcpy(meta.data() + 1 + sizeof(plaintext_len), &compressed_len, sizeof(compressed_len));
  return crypto::sha256_hex({&chunk.ciphertext, &chunk.tag, &meta});
}

} // namespace store
} // namespace rpipe
