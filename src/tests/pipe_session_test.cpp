#include <gtest/gtest.h>
#include <chrono>
#include "common/pipe_error.hpp"
#include "session/pipe_session.hpp"

using namespace rpipe;
using namespace rpipe::session;

class PipeSessionTest : public ::testing::Test {
protected:
    const Clock::time_point start = Clock::now();
    PipeSession session{"abc123", Bytes(32, 1), Bytes(32, 2), start};
};

// Test initial state
TEST_F(PipeSessionTest, InitialState) {
    EXPECT_EQ(session.get_state(), SessionState::OPEN);
    EXPECT_EQ(session.get_state_string(), "OPEN");
    EXPECT_FALSE(session.is_terminal());
    EXPECT_EQ(session.next_write_seq(), 0u);
    EXPECT_EQ(session.acked_count(), 0u);
    EXPECT_TRUE(session.fully_acked());
    EXPECT_EQ(session.id(), "abc123");
    EXPECT_EQ(session.salt(), Bytes(32, 1));
    EXPECT_EQ(session.verifier(), Bytes(32, 2));
    EXPECT_EQ(session.created_at(), start);
}

// Test the OPEN -> SEALED -> EXPIRED path
TEST_F(PipeSessionTest, ValidTransitions) {
    EXPECT_TRUE(session.transition_to(SessionState::SEALED));
    EXPECT_EQ(session.get_state(), SessionState::SEALED);

    EXPECT_TRUE(session.transition_to(SessionState::EXPIRED));
    EXPECT_EQ(session.get_state(), SessionState::EXPIRED);
    EXPECT_TRUE(session.is_terminal());
}

// An idle OPEN session can expire directly
TEST_F(PipeSessionTest, OpenCanExpire) {
    EXPECT_TRUE(session.transition_to(SessionState::EXPIRED));
    EXPECT_TRUE(session.is_terminal());
}

// Test invalid state transitions
TEST_F(PipeSessionTest, InvalidTransitions) {
    // No self transition
    EXPECT_FALSE(session.transition_to(SessionState::OPEN));

    ASSERT_TRUE(session.transition_to(SessionState::SEALED));
    // Sealing is one way
    EXPECT_FALSE(session.transition_to(SessionState::OPEN));
    EXPECT_FALSE(session.transition_to(SessionState::SEALED));

    ASSERT_TRUE(session.transition_to(SessionState::EXPIRED));
    // Nothing leaves EXPIRED
    EXPECT_FALSE(session.transition_to(SessionState::OPEN));
    EXPECT_FALSE(session.transition_to(SessionState::SEALED));
    EXPECT_EQ(session.get_state(), SessionState::EXPIRED);
}

TEST_F(PipeSessionTest, WriteSequenceOnlyAdvancesWhileOpen) {
    session.advance_write_seq();
    session.advance_write_seq();
    EXPECT_EQ(session.next_write_seq(), 2u);

    ASSERT_TRUE(session.transition_to(SessionState::SEALED));
    EXPECT_THROW(session.advance_write_seq(), LifecycleError);
    EXPECT_EQ(session.next_write_seq(), 2u);
}

TEST_F(PipeSessionTest, AcksAreInclusiveAndMonotonic) {
    for (int i = 0; i < 5; ++i) {
        session.advance_write_seq();
    }

    session.record_ack(2);
    EXPECT_EQ(session.acked_count(), 3u);
    EXPECT_FALSE(session.fully_acked());

    // Stale ack does not move the mark backwards
    session.record_ack(0);
    EXPECT_EQ(session.acked_count(), 3u);

    session.record_ack(4);
    EXPECT_EQ(session.acked_count(), 5u);
    EXPECT_TRUE(session.fully_acked());
}

TEST_F(PipeSessionTest, IdleTracking) {
    const auto ttl = std::chrono::seconds(10);
    EXPECT_FALSE(session.idle_beyond(start + std::chrono::seconds(10), ttl));
    EXPECT_TRUE(session.idle_beyond(start + std::chrono::seconds(11), ttl));

    session.touch(start + std::chrono::seconds(8));
    EXPECT_EQ(session.last_activity_at(), start + std::chrono::seconds(8));
    EXPECT_FALSE(session.idle_beyond(start + std::chrono::seconds(11), ttl));
    EXPECT_TRUE(session.idle_beyond(start + std::chrono::seconds(19), ttl));
}

TEST_F(PipeSessionTest, StateNames) {
    EXPECT_EQ(PipeSession::state_to_string(SessionState::SEALED), "SEALED");
    EXPECT_EQ(PipeSession::state_to_string(SessionState::EXPIRED), "EXPIRED");
    EXPECT_TRUE(PipeSession::is_valid_transition(SessionState::OPEN, SessionState::SEALED));
    EXPECT_FALSE(PipeSession::is_valid_transition(SessionState::EXPIRED, SessionState::OPEN));
}
