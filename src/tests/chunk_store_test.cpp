#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include "store/chunk_store.hpp"
#include "test_utils.hpp"

using namespace rpipe;
using namespace rpipe::store;
using session::SessionState;

class ChunkStoreTest : public ::testing::Test {
protected:
  config::PipeConfig config;
  FakeClock clock;
  std::unique_ptr<ChunkStore> store;
  SessionId id;

  void SetUp() override {
    init_test_logging();
    config = make_test_config();
    config.buffer_capacity = 4;
    config.session_ttl = std::chrono::seconds(60);
    config.append_wait = std::chrono::milliseconds(20);
    reset_store();
  }

  void reset_store() {
    store = std::make_unique<ChunkStore>(config, [this] { return clock.now(); });
    id = store->open_session(Bytes(32, 0xaa), Bytes(32, 0xbb));
  }

  Chunk make_chunk(Seq seq, const std::string& content, bool last = false) const {
    Chunk chunk;
    chunk.session_id = id;
    chunk.seq = seq;
    chunk.ciphertext = to_bytes(content);
    chunk.tag = Bytes(16, static_cast<uint8_t>(seq));
    chunk.plaintext_len = static_cast<uint32_t>(content.size());
    chunk.compressed_len = static_cast<uint32_t>(content.size());
    chunk.is_last = last;
    return chunk;
  }

  void append_ok(Seq seq, const std::string& content, bool last = false) {
    const auto result = store->append(make_chunk(seq, content, last));
    ASSERT_EQ(result.status, Status::ACCEPTED) << "seq " << seq;
    ASSERT_EQ(result.expected, seq + 1);
  }

  std::string fetch_content(Seq seq) {
    auto result = store->fetch(id, seq);
    EXPECT_EQ(result.status, Status::OK) << "seq " << seq;
    if (!result.chunk) {
      return {};
    }
    return to_string(result.chunk->ciphertext);
  }

  SessionState state() {
    auto status = store->status(id);
    EXPECT_TRUE(status.has_value());
    return status ? status->state : SessionState::EXPIRED;
  }
};

TEST_F(ChunkStoreTest, OpenSessionIssuesDistinctIds) {
  const SessionId other = store->open_session(Bytes(32, 1), Bytes(32, 2));
  EXPECT_NE(other, id);
  EXPECT_EQ(id.size(), 32u);
  EXPECT_TRUE(store->has_session(id));
  EXPECT_TRUE(store->has_session(other));
  EXPECT_FALSE(store->has_session("missing"));
}

TEST_F(ChunkStoreTest, RepeatedOpenReturnsSameSession) {
  EXPECT_EQ(store->open_session(Bytes(32, 0xaa), Bytes(32, 0xbb)), id);
  EXPECT_EQ(store->stats().sessions, 1u);

  // Same salt under a different verifier is a different writer
  const SessionId other = store->open_session(Bytes(32, 0xaa), Bytes(32, 0xcc));
  EXPECT_NE(other, id);

  append_ok(0, "a");
  ASSERT_EQ(store->close_session(id), Status::OK);
  ASSERT_EQ(store->ack(id, 0).status, Status::OK);
  ASSERT_EQ(store->close_session(id), Status::OK);
  EXPECT_FALSE(store->has_session(id));

  // A released session is never handed out again
  const SessionId reopened = store->open_session(Bytes(32, 0xaa), Bytes(32, 0xbb));
  EXPECT_NE(reopened, id);
  EXPECT_TRUE(store->has_session(reopened));
}

TEST_F(ChunkStoreTest, AttachReturnsHandshake) {
  append_ok(0, "a");
  const auto handshake = store->attach_session(id);
  ASSERT_TRUE(handshake.has_value());
  EXPECT_EQ(handshake->salt, Bytes(32, 0xaa));
  EXPECT_EQ(handshake->verifier, Bytes(32, 0xbb));
  EXPECT_EQ(handshake->state, SessionState::OPEN);
  EXPECT_EQ(handshake->next_write_seq, 1u);

  EXPECT_FALSE(store->attach_session("missing").has_value());
}

TEST_F(ChunkStoreTest, FetchReturnsChunksInOrder) {
  append_ok(0, "Hell");
  append_ok(1, "oWor");
  append_ok(2, "ld", true);

  EXPECT_EQ(fetch_content(0), "Hell");
  EXPECT_EQ(fetch_content(1), "oWor");

  auto last = store->fetch(id, 2);
  ASSERT_EQ(last.status, Status::OK);
  ASSERT_TRUE(last.chunk);
  EXPECT_EQ(to_string(last.chunk->ciphertext), "ld");
  EXPECT_TRUE(last.chunk->is_last);
  EXPECT_EQ(last.chunk->tag, Bytes(16, 2));
}

TEST_F(ChunkStoreTest, FetchAheadOfWriterIsNotYetAvailable) {
  EXPECT_EQ(store->fetch(id, 0).status, Status::NOT_YET_AVAILABLE);
  append_ok(0, "x");
  EXPECT_EQ(store->fetch(id, 1).status, Status::NOT_YET_AVAILABLE);
  EXPECT_FALSE(store->fetch(id, 1).chunk.has_value());
}

TEST_F(ChunkStoreTest, RetriedAppendIsIdempotent) {
  append_ok(0, "first");

  const auto retry = store->append(make_chunk(0, "first"));
  EXPECT_EQ(retry.status, Status::DUPLICATE);
  EXPECT_EQ(retry.expected, 1u);

  const auto status = store->status(id);
  ASSERT_TRUE(status);
  EXPECT_EQ(status->next_write_seq, 1u);
  EXPECT_EQ(status->buffered_chunks, 1u);
}

TEST_F(ChunkStoreTest, DifferentContentAtSameSeqConflicts) {
  append_ok(0, "first");
  EXPECT_EQ(store->append(make_chunk(0, "other")).status, Status::SEQUENCE_CONFLICT);

  // Same bytes with a different end-of-stream flag are different content
  EXPECT_EQ(store->append(make_chunk(0, "first", true)).status, Status::SEQUENCE_CONFLICT);
  EXPECT_EQ(fetch_content(0), "first");
}

TEST_F(ChunkStoreTest, SequenceGapIsRejected) {
  append_ok(0, "a");

  const auto result = store->append(make_chunk(2, "c"));
  EXPECT_EQ(result.status, Status::SEQUENCE_MISMATCH);
  EXPECT_EQ(result.expected, 1u);

  append_ok(1, "b");
  append_ok(2, "c");
}

TEST_F(ChunkStoreTest, AckEvictsAndFreesCapacity) {
  for (Seq seq = 0; seq < 4; ++seq) {
    append_ok(seq, "chunk" + std::to_string(seq));
  }
  EXPECT_EQ(store->append(make_chunk(4, "chunk4")).status, Status::STORE_FULL);

  const auto ack = store->ack(id, 1);
  EXPECT_EQ(ack.status, Status::OK);
  EXPECT_EQ(ack.expected, 2u);

  append_ok(4, "chunk4");
  EXPECT_EQ(store->fetch(id, 0).status, Status::EVICTED);
  EXPECT_EQ(store->fetch(id, 1).status, Status::EVICTED);
  EXPECT_EQ(fetch_content(2), "chunk2");

  const auto status = store->status(id);
  ASSERT_TRUE(status);
  EXPECT_EQ(status->acked_count, 2u);
  EXPECT_EQ(status->buffered_chunks, 3u);
}

TEST_F(ChunkStoreTest, AckNeverMovesBackwards) {
  append_ok(0, "a");
  append_ok(1, "b");
  append_ok(2, "c");

  EXPECT_EQ(store->ack(id, 1).status, Status::OK);
  EXPECT_EQ(store->ack(id, 0).status, Status::OK);
  EXPECT_EQ(store->status(id)->acked_count, 2u);
  EXPECT_EQ(store->fetch(id, 0).status, Status::EVICTED);
}

TEST_F(ChunkStoreTest, AckOfUnwrittenSeqIsRejected) {
  append_ok(0, "a");
  const auto result = store->ack(id, 1);
  EXPECT_EQ(result.status, Status::SEQUENCE_MISMATCH);
  EXPECT_EQ(result.expected, 1u);
  EXPECT_EQ(store->status(id)->acked_count, 0u);
}

TEST_F(ChunkStoreTest, RetryOfEvictedChunkIsDuplicate) {
  append_ok(0, "a");
  append_ok(1, "b");
  ASSERT_EQ(store->ack(id, 0).status, Status::OK);
  append_ok(2, "c");  // triggers eviction of seq 0

  EXPECT_EQ(store->append(make_chunk(0, "a")).status, Status::DUPLICATE);
}

TEST_F(ChunkStoreTest, BlockedAppendResumesAfterAck) {
  config.append_wait = std::chrono::milliseconds(5000);
  reset_store();
  for (Seq seq = 0; seq < 4; ++seq) {
    append_ok(seq, "x");
  }

  auto pending = std::async(std::launch::async, [this] {
    return store->append(make_chunk(4, "y"));
  });
  EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

  ASSERT_EQ(store->ack(id, 0).status, Status::OK);
  ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(pending.get().status, Status::ACCEPTED);
}

TEST_F(ChunkStoreTest, FinalChunkSealsSession) {
  append_ok(0, "a");
  append_ok(1, "b", true);
  EXPECT_EQ(state(), SessionState::SEALED);

  // Retry of the final chunk is still a duplicate
  EXPECT_EQ(store->append(make_chunk(1, "b", true)).status, Status::DUPLICATE);
  EXPECT_EQ(store->append(make_chunk(2, "c")).status, Status::SESSION_SEALED);

  // Readers can still drain
  EXPECT_EQ(fetch_content(0), "a");
  EXPECT_EQ(fetch_content(1), "b");
  EXPECT_EQ(store->fetch(id, 2).status, Status::SESSION_SEALED);
}

TEST_F(ChunkStoreTest, CloseLifecycle) {
  append_ok(0, "a");
  append_ok(1, "b");

  // Writer close seals
  EXPECT_EQ(store->close_session(id), Status::OK);
  EXPECT_EQ(state(), SessionState::SEALED);
  EXPECT_EQ(store->append(make_chunk(2, "c")).status, Status::SESSION_SEALED);

  // Undelivered chunks keep it alive
  EXPECT_EQ(store->close_session(id), Status::OK);
  EXPECT_TRUE(store->has_session(id));

  ASSERT_EQ(store->ack(id, 1).status, Status::OK);
  EXPECT_EQ(store->close_session(id), Status::OK);
  EXPECT_FALSE(store->has_session(id));
  EXPECT_EQ(store->close_session(id), Status::SESSION_NOT_FOUND);
  EXPECT_EQ(store->stats().expired_total, 1u);
}

TEST_F(ChunkStoreTest, HelloWorldScenario) {
  append_ok(0, "Hell");
  append_ok(1, "oWor");
  EXPECT_EQ(state(), SessionState::OPEN);
  append_ok(2, "ld", true);
  EXPECT_EQ(state(), SessionState::SEALED);

  std::string output;
  for (Seq seq = 0; seq < 3; ++seq) {
    output += fetch_content(seq);
  }
  EXPECT_EQ(output, "HelloWorld");

  ASSERT_EQ(store->ack(id, 2).status, Status::OK);
  EXPECT_EQ(store->close_session(id), Status::OK);
  EXPECT_FALSE(store->has_session(id));
  EXPECT_EQ(store->fetch(id, 0).status, Status::SESSION_NOT_FOUND);
}

TEST_F(ChunkStoreTest, UnknownSessionIsNotFound) {
  Chunk chunk = make_chunk(0, "a");
  chunk.session_id = "nope";
  EXPECT_EQ(store->append(chunk).status, Status::SESSION_NOT_FOUND);
  EXPECT_EQ(store->fetch("nope", 0).status, Status::SESSION_NOT_FOUND);
  EXPECT_EQ(store->ack("nope", 0).status, Status::SESSION_NOT_FOUND);
  EXPECT_EQ(store->close_session("nope"), Status::SESSION_NOT_FOUND);
  EXPECT_FALSE(store->status("nope").has_value());
}

TEST_F(ChunkStoreTest, SweepExpiresIdleSessions) {
  append_ok(0, "a");
  const SessionId busy = store->open_session(Bytes(32, 1), Bytes(32, 2));

  clock.advance(std::chrono::seconds(40));
  EXPECT_EQ(store->fetch(busy, 0).status, Status::NOT_YET_AVAILABLE);  // keeps it alive
  EXPECT_EQ(store->expire_sweep(), 0u);

  clock.advance(std::chrono::seconds(30));
  EXPECT_EQ(store->expire_sweep(), 1u);
  EXPECT_FALSE(store->has_session(id));
  EXPECT_TRUE(store->has_session(busy));
  EXPECT_EQ(store->fetch(id, 0).status, Status::SESSION_NOT_FOUND);

  clock.advance(std::chrono::seconds(61));
  EXPECT_EQ(store->expire_sweep(), 1u);

  const auto stats = store->stats();
  EXPECT_EQ(stats.sessions, 0u);
  EXPECT_EQ(stats.expired_total, 2u);
}

TEST_F(ChunkStoreTest, SealedSessionsExpireToo) {
  append_ok(0, "a", true);
  clock.advance(std::chrono::seconds(61));
  EXPECT_EQ(store->expire_sweep(), 1u);
  EXPECT_FALSE(store->has_session(id));
}

TEST_F(ChunkStoreTest, ExpiryWakesBlockedAppend) {
  config.append_wait = std::chrono::milliseconds(5000);
  reset_store();
  for (Seq seq = 0; seq < 4; ++seq) {
    append_ok(seq, "x");
  }

  auto pending = std::async(std::launch::async, [this] {
    return store->append(make_chunk(4, "y"));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  clock.advance(std::chrono::seconds(61));
  EXPECT_EQ(store->expire_sweep(), 1u);

  ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(pending.get().status, Status::SESSION_NOT_FOUND);
}

TEST_F(ChunkStoreTest, StatusAndStats) {
  append_ok(0, "12345");
  append_ok(1, "678");
  clock.advance(std::chrono::milliseconds(1500));

  const auto status = store->status(id);
  ASSERT_TRUE(status);
  EXPECT_EQ(status->state, SessionState::OPEN);
  EXPECT_EQ(status->next_write_seq, 2u);
  EXPECT_EQ(status->buffered_chunks, 2u);
  EXPECT_EQ(status->buffered_bytes, 8u + 2 * 16);
  EXPECT_EQ(status->age_ms, 1500u);
  EXPECT_EQ(status->idle_ms, 1500u);

  store->open_session(Bytes(32, 1), Bytes(32, 2));
  const auto stats = store->stats();
  EXPECT_EQ(stats.sessions, 2u);
  EXPECT_EQ(stats.buffered_chunks, 2u);
  EXPECT_EQ(stats.buffered_bytes, 8u + 2 * 16);
  EXPECT_EQ(stats.expired_total, 0u);
}

TEST_F(ChunkStoreTest, ConcurrentWriterAndReaders) {
  constexpr Seq total = 300;
  config.append_wait = std::chrono::milliseconds(50);
  reset_store();

  std::thread writer([this] {
    for (Seq seq = 0; seq < total;) {
      const auto result = store->append(make_chunk(seq, "payload-" + std::to_string(seq), seq + 1 == total));
      if (result.status == Status::ACCEPTED) {
        ++seq;
      } else {
        ASSERT_EQ(result.status, Status::STORE_FULL);
      }
    }
  });

  // Second reader only observes; it must never see out-of-order content
  std::atomic<bool> done{false};
  std::atomic<int> observer_errors{0};
  std::thread observer([this, &done, &observer_errors] {
    while (!done) {
      const auto status = store->status(id);
      if (!status || status->next_write_seq == 0) {
        continue;
      }
      const Seq seq = status->next_write_seq - 1;
      const auto result = store->fetch(id, seq);
      if (result.status == Status::OK && to_string(result.chunk->ciphertext) != "payload-" + std::to_string(seq)) {
        ++observer_errors;
      }
    }
  });

  for (Seq seq = 0; seq < total;) {
    auto result = store->fetch(id, seq);
    if (result.status == Status::NOT_YET_AVAILABLE) {
      std::this_thread::yield();
      continue;
    }
    ASSERT_EQ(result.status, Status::OK);
    ASSERT_EQ(to_string(result.chunk->ciphertext), "payload-" + std::to_string(seq));
    ASSERT_EQ(store->ack(id, seq).status, Status::OK);
    ++seq;
  }

  writer.join();
  done = true;
  observer.join();
  EXPECT_EQ(observer_errors.load(), 0);
  EXPECT_EQ(store->close_session(id), Status::OK);
  EXPECT_FALSE(store->has_session(id));
}
