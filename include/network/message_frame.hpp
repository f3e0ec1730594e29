#ifndef RPIPE_NETWORK_MESSAGE_FRAME_HPP
#define RPIPE_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <string>
#include "common/status.hpp"
#include "common/types.hpp"
#include "store/chunk.hpp"

namespace rpipe {
namespace network {

// Message type used to differentiate between requests
enum class MessageType : uint8_t {
    OPEN_SESSION = 1,
    ATTACH_SESSION = 2,
    APPEND_CHUNK = 3,
    FETCH_CHUNK = 4,
    ACK = 5,
    CLOSE_SESSION = 6,
    SESSION_STATUS = 7,
    SERVER_STATS = 8,
    ERROR = 0xFF
};

inline const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::OPEN_SESSION: return "OpenSession";
        case MessageType::ATTACH_SESSION: return "AttachSession";
        case MessageType::APPEND_CHUNK: return "AppendChunk";
        case MessageType::FETCH_CHUNK: return "FetchChunk";
        case MessageType::ACK: return "Ack";
        case MessageType::CLOSE_SESSION: return "CloseSession";
        case MessageType::SESSION_STATUS: return "SessionStatus";
        case MessageType::SERVER_STATS: return "ServerStats";
        case MessageType::ERROR: return "Error";
        default: return "Unknown";
    }
}

// Client request. Only the fields relevant to `type` are encoded:
//   OPEN_SESSION                      salt, verifier
//   ATTACH/CLOSE/SESSION_STATUS       session_id
//   APPEND_CHUNK                      chunk
//   FETCH_CHUNK, ACK                  session_id, seq
//   SERVER_STATS                      nothing
struct Request {
    MessageType type = MessageType::OPEN_SESSION;
    SessionId session_id;
    Seq seq = 0;
    Bytes salt;
    Bytes verifier;
    store::Chunk chunk;
};

// Server response. `type` echoes the request type (ERROR for unparseable
// requests). Payload fields depend on type and status:
//   OPEN_SESSION    session_id
//   ATTACH_SESSION  salt, verifier, state, seq (next_write_seq) when OK
//   APPEND_CHUNK    seq (expected next_write_seq)
//   FETCH_CHUNK     chunk when OK
//   ACK             seq (expected)
//   SESSION_STATUS  session_status when OK
//   SERVER_STATS    stats
struct Response {
    MessageType type = MessageType::ERROR;
    Status status = Status::OK;
    SessionId session_id;
    Seq seq = 0;
    Bytes salt;
    Bytes verifier;
    session::SessionState state = session::SessionState::OPEN;
    store::Chunk chunk;
    store::SessionStatus session_status;
    store::StoreStats stats;
};

} // namespace network
} // namespace rpipe

#endif // RPIPE_NETWORK_MESSAGE_FRAME_HPP
