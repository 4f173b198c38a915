#include "bitsd/upload/types.hpp"

namespace bitsd::upload {

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Open: return "open";
        case SessionState::Committed: return "committed";
        case SessionState::Cancelled: return "cancelled";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnknownSession: return "unknown session";
        case ErrorKind::NotOpen: return "no active session";
        case ErrorKind::Malformed: return "malformed request";
        case ErrorKind::SizeConflict: return "total size conflict";
        case ErrorKind::DataMismatch: return "retransmitted data mismatch";
        case ErrorKind::TooLarge: return "fragment too large";
        case ErrorKind::Incomplete: return "incomplete upload";
        case ErrorKind::ProtocolMismatch: return "protocol mismatch";
        case ErrorKind::AccessDenied: return "access denied";
        case ErrorKind::TargetInUse: return "target in use";
        case ErrorKind::Internal: return "internal failure";
    }
    return "unknown";
}

} // namespace bitsd::upload
