#pragma once

#include "bitsd/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace bitsd::protocol {

enum class OutcomeKind {
    SessionCreated,
    FragmentAccepted,
    SessionClosed,
    SessionCancelled,
    PingAcknowledged,
    Rejected
};

/**
 * @brief Result of dispatching one command, before it becomes HTTP
 */
struct Outcome {
    OutcomeKind kind = OutcomeKind::Rejected;
    std::string session_id;
    std::string protocol;                          ///< Negotiated protocol (SessionCreated)
    std::optional<std::uint64_t> received_prefix;  ///< FragmentAccepted
    std::optional<upload::UploadError> error;      ///< Rejected

    static Outcome created(std::string session_id, std::string protocol) {
        Outcome outcome;
        outcome.kind = OutcomeKind::SessionCreated;
        outcome.session_id = std::move(session_id);
        outcome.protocol = std::move(protocol);
        return outcome;
    }

    static Outcome fragment_accepted(std::string session_id, std::uint64_t received_prefix) {
        Outcome outcome;
        outcome.kind = OutcomeKind::FragmentAccepted;
        outcome.session_id = std::move(session_id);
        outcome.received_prefix = received_prefix;
        return outcome;
    }

    static Outcome acknowledged(OutcomeKind kind, std::string session_id = {}) {
        Outcome outcome;
        outcome.kind = kind;
        outcome.session_id = std::move(session_id);
        return outcome;
    }

    static Outcome rejected(upload::UploadError error, std::string session_id = {}) {
        Outcome outcome;
        outcome.kind = OutcomeKind::Rejected;
        outcome.session_id = std::move(session_id);
        outcome.error = std::move(error);
        return outcome;
    }

    static Outcome rejected(upload::ErrorKind kind, std::string message, std::string session_id = {}) {
        return rejected(upload::UploadError{kind, std::move(message)}, std::move(session_id));
    }
};

} // namespace bitsd::protocol
