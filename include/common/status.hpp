#ifndef RPIPE_COMMON_STATUS_HPP
#define RPIPE_COMMON_STATUS_HPP

#include <cstdint>
#include <ostream>

namespace rpipe {

// Outcome of a store operation, carried verbatim on the wire
enum class Status : uint8_t {
    OK = 0,
    ACCEPTED,
    DUPLICATE,
    SEQUENCE_MISMATCH,
    SEQUENCE_CONFLICT,
    SESSION_NOT_FOUND,
    SESSION_SEALED,
    STORE_FULL,
    NOT_YET_AVAILABLE,
    EVICTED,
    BAD_REQUEST
};

inline const char* status_to_string(Status status) {
    switch (status) {
        case Status::OK: return "Ok";
        case Status::ACCEPTED: return "Accepted";
        case Status::DUPLICATE: return "Duplicate";
        case Status::SEQUENCE_MISMATCH: return "Sequence mismatch";
        case Status::SEQUENCE_CONFLICT: return "Sequence conflict";
        case Status::SESSION_NOT_FOUND: return "Session not found";
        case Status::SESSION_SEALED: return "Session sealed";
        case Status::STORE_FULL: return "Store full";
        case Status::NOT_YET_AVAILABLE: return "Not yet available";
        case Status::EVICTED: return "Evicted";
        case Status::BAD_REQUEST: return "Bad request";
        default: return "Undefined status";
    }
}

inline bool is_valid_status(uint8_t raw) {
    return raw <= static_cast<uint8_t>(Status::BAD_REQUEST);
}

inline std::ostream& operator<<(std::ostream& os, Status status) {
    os << status_to_string(status);
    return os;
}

} // namespace rpipe

#endif // RPIPE_COMMON_STATUS_HPP
