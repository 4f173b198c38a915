/**
 * @file events.hpp
 * @brief Upload lifecycle events
 *
 * NAMING CONVENTION:
 * Events are past-tense: SessionCreatedEvent, FragmentReceivedEvent
 */

#pragma once

#include "bitsd/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace bitsd::events {

using Clock = std::chrono::system_clock;

/**
 * @brief Emitted after a Create-Session packet opened a new upload
 */
struct SessionCreatedEvent {
    std::string session_id;
    std::string target_path;
    Clock::time_point timestamp;

    SessionCreatedEvent(std::string id, std::string target)
        : session_id(std::move(id)),
          target_path(std::move(target)),
          timestamp(Clock::now()) {}
};

/**
 * @brief Emitted for every fragment written to a backing file
 */
struct FragmentReceivedEvent {
    std::string session_id;
    upload::ByteRange range;
    std::uint64_t total_size;
    std::uint64_t received_prefix;   ///< Contiguous bytes from offset 0 after this fragment
    Clock::time_point timestamp;

    FragmentReceivedEvent(std::string id, upload::ByteRange r, std::uint64_t total, std::uint64_t prefix)
        : session_id(std::move(id)),
          range(r),
          total_size(total),
          received_prefix(prefix),
          timestamp(Clock::now()) {}
};

/**
 * @brief Emitted when a complete upload was promoted to its target path
 */
struct SessionCommittedEvent {
    std::string session_id;
    std::string target_path;
    std::uint64_t total_bytes;
    std::chrono::milliseconds duration;
    Clock::time_point timestamp;

    SessionCommittedEvent(std::string id, std::string target, std::uint64_t bytes, std::chrono::milliseconds d)
        : session_id(std::move(id)),
          target_path(std::move(target)),
          total_bytes(bytes),
          duration(d),
          timestamp(Clock::now()) {}
};

struct SessionCancelledEvent {
    std::string session_id;
    std::string target_path;
    Clock::time_point timestamp;

    SessionCancelledEvent(std::string id, std::string target)
        : session_id(std::move(id)),
          target_path(std::move(target)),
          timestamp(Clock::now()) {}
};

/**
 * @brief Emitted when a session was forced into the Failed state
 */
struct SessionFailedEvent {
    std::string session_id;
    upload::ErrorKind kind;
    std::string reason;
    Clock::time_point timestamp;

    SessionFailedEvent(std::string id, upload::ErrorKind k, std::string why)
        : session_id(std::move(id)),
          kind(k),
          reason(std::move(why)),
          timestamp(Clock::now()) {}
};

/**
 * @brief Emitted by the idle sweep for each session it cancelled
 */
struct SessionExpiredEvent {
    std::string session_id;
    std::chrono::seconds idle_limit;
    Clock::time_point timestamp;

    SessionExpiredEvent(std::string id, std::chrono::seconds limit)
        : session_id(std::move(id)),
          idle_limit(limit),
          timestamp(Clock::now()) {}
};

/**
 * @brief Emitted when a request was answered with a client or server error
 */
struct RequestRejectedEvent {
    std::string packet_type;
    std::string session_id;     ///< Empty when the request named no session
    upload::ErrorKind kind;
    std::string message;
    Clock::time_point timestamp;

    RequestRejectedEvent(std::string packet, std::string id, upload::ErrorKind k, std::string msg)
        : packet_type(std::move(packet)),
          session_id(std::move(id)),
          kind(k),
          message(std::move(msg)),
          timestamp(Clock::now()) {}
};

struct ServerStartedEvent {
    uint16_t port;
    std::string upload_root;
    Clock::time_point timestamp;

    ServerStartedEvent(uint16_t p, std::string root)
        : port(p),
          upload_root(std::move(root)),
          timestamp(Clock::now()) {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    Clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string why)
        : reason(std::move(why)),
          timestamp(Clock::now()) {}
};

} // namespace bitsd::events
