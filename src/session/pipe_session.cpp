#include "session/pipe_session.hpp"
#include "common/pipe_error.hpp"
#include <boost/log/trivial.hpp>

namespace rpipe {
namespace session {

PipeSession::PipeSession(SessionId id, Bytes salt, Bytes verifier, TimePoint now)
  : id_(std::move(id))
  , salt_(std::move(salt))
  , verifier_(std::move(verifier))
  , created_at_(now)
  , last_activity_(now.time_since_epoch().count()) {
  BOOST_LOG_TRIVIAL(debug) << "Pipe session: Created session " << id_;
}

//==============================================
// STATE MACHINE
//==============================================

bool PipeSession::transition_to(SessionState new_state) {
  if (!is_valid_transition(state_, new_state)) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe session: Rejected transition " << state_
                               << " -> " << new_state << " for session " << id_;
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Pipe session: Session " << id_ << " " << state_ << " -> " << new_state;
  state_ = new_state;
  return true;
}

bool PipeSession::is_valid_transition(SessionState from, SessionState to) {
  switch (from) {
    case SessionState::OPEN:
      return to == SessionState::SEALED ||
             to == SessionState::EXPIRED;

    case SessionState::SEALED:
      return to == SessionState::EXPIRED;

    case SessionState::EXPIRED:
      return false;
  }
  return false;
}

std::string PipeSession::state_to_string(SessionState state) {
  switch (state) {
    case SessionState::OPEN:    return "OPEN";
    case SessionState::SEALED:  return "SEALED";
    case SessionState::EXPIRED: return "EXPIRED";
    default:                    return "UNKNOWN";
  }
}

//==============================================
// SEQUENCING
//==============================================

void PipeSession::advance_write_seq() {
  if (state_ != SessionState::OPEN) {
    throw LifecycleError("Cannot append to session " + id_ + " in state " + state_to_string(state_));
  }
  ++next_write_seq_;
}

void PipeSession::record_ack(Seq seq) {
  const Seq count = seq + 1;
  Seq current = acked_count_.load();
  while (current < count && !acked_count_.compare_exchange_weak(current, count)) {
  }
}

//==============================================
// ACTIVITY TRACKING
//==============================================

void PipeSession::touch(TimePoint now) {
  last_activity_.store(now.time_since_epoch().count());
}

PipeSession::TimePoint PipeSession::last_activity_at() const {
  return TimePoint(Clock::duration(last_activity_.load()));
}

bool PipeSession::idle_beyond(TimePoint now, Clock::duration ttl) const {
  return now - last_activity_at() > ttl;
}

std::ostream& operator<<(std::ostream& os, SessionState state) {
  os << PipeSession::state_to_string(state);
  return os;
}

} // namespace session
} // namespace rpipe
