#ifndef RPIPE_SESSION_PIPE_SESSION_HPP
#define RPIPE_SESSION_PIPE_SESSION_HPP

#include <atomic>
#include <ostream>
#include <string>
#include "common/types.hpp"

namespace rpipe {
namespace session {

/**
 * Pipe session lifecycle:
 * OPEN    - writer may append chunks
 * SEALED  - writer declared end of stream, readers may still drain
 * EXPIRED - terminal, all chunks released
 */
enum class SessionState : uint8_t {
    OPEN = 0,
    SEALED,
    EXPIRED
};

/**
 * Server-side record of one pipe: identity, handshake parameters, write
 * sequence counter, acknowledged high-water mark and lifecycle state.
 * Mutations other than touch() and record_ack() must happen under the
 * owning store's exclusive session lock.
 */
class PipeSession {
public:
    using TimePoint = Clock::time_point;

    PipeSession(SessionId id, Bytes salt, Bytes verifier, TimePoint now);

    PipeSession(const PipeSession&) = delete;
    PipeSession& operator=(const PipeSession&) = delete;


    // ---- STATE MACHINE ----
    SessionState get_state() const { return state_; }
    std::string get_state_string() const { return state_to_string(state_); }
    bool is_terminal() const { return state_ == SessionState::EXPIRED; }

    /**
     * Attempt to transition to a new state.
     * @return true if the transition was valid and applied
     */
    bool transition_to(SessionState new_state);

    static bool is_valid_transition(SessionState from, SessionState to);
    static std::string state_to_string(SessionState state);


    // ---- SEQUENCING ----
    Seq next_write_seq() const { return next_write_seq_; }
    // Advances next_write_seq by exactly one; only legal while OPEN
    void advance_write_seq();

    // Number of chunks the reader has acknowledged (0 = none)
    Seq acked_count() const { return acked_count_.load(); }
    // Raises the acked high-water mark to seq + 1; never moves it backwards
    void record_ack(Seq seq);
    bool fully_acked() const { return acked_count() == next_write_seq_; }


    // ---- ACTIVITY TRACKING ----
    void touch(TimePoint now);
    TimePoint last_activity_at() const;
    TimePoint created_at() const { return created_at_; }
    bool idle_beyond(TimePoint now, Clock::duration ttl) const;


    // ---- GETTERS ----
    const SessionId& id() const { return id_; }
    const Bytes& salt() const { return salt_; }
    const Bytes& verifier() const { return verifier_; }

private:
    const SessionId id_;
    const Bytes salt_;
    const Bytes verifier_;
    const TimePoint created_at_;

    SessionState state_ = SessionState::OPEN;
    Seq next_write_seq_ = 0;
    std::atomic<Seq> acked_count_{0};
    std::atomic<Clock::rep> last_activity_;
};

std::ostream& operator<<(std::ostream& os, SessionState state);

} // namespace session
} // namespace rpipe

#endif // RPIPE_SESSION_PIPE_SESSION_HPP
