#pragma once

#include "bitsd/core/result.hpp"

#include <cstdint>
#include <string>

namespace bitsd::upload {

enum class SessionState {
    Open,
    Committed,
    Cancelled,
    Failed
};

/**
 * @brief Failure categories surfaced by the upload engine
 *
 * Each category maps to exactly one HTTP status / BITS-Error-Code pair in
 * the protocol codec.
 */
enum class ErrorKind {
    UnknownSession,   ///< No such session id (or it was expired)
    NotOpen,          ///< Session exists but already reached a terminal state
    Malformed,        ///< Bad headers, bad range, payload/range length mismatch
    SizeConflict,     ///< Fragment declared a different total than before
    DataMismatch,     ///< Retransmitted bytes differ from the ones already stored
    TooLarge,         ///< Fragment exceeds the configured size limit
    Incomplete,       ///< Close requested before [0, total) was covered
    ProtocolMismatch, ///< No common BITS protocol with the client
    AccessDenied,     ///< Target path is not writable by an upload
    TargetInUse,      ///< Another open session is uploading the same target
    Internal          ///< Storage I/O failure
};

struct UploadError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

template<typename T>
using UploadResult = bitsd::Result<T, UploadError>;

inline UploadResult<void> upload_ok() {
    return bitsd::Ok<UploadError>();
}

template<typename T = void>
UploadResult<T> upload_error(ErrorKind kind, std::string message) {
    return bitsd::Err<T, UploadError>(UploadError{kind, std::move(message)});
}

/**
 * @brief Half-open byte interval [start, end)
 */
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }
    [[nodiscard]] bool empty() const noexcept { return end <= start; }

    bool operator==(const ByteRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const ByteRange& other) const noexcept { return !(*this == other); }
};

const char* to_string(SessionState state) noexcept;
const char* to_string(ErrorKind kind) noexcept;

} // namespace bitsd::upload
