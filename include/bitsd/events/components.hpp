/**
 * @file components.hpp
 * @brief Event-driven logging and metrics for the upload service
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "bitsd/events/event_bus.hpp"
#include "bitsd/events/events.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>

namespace bitsd::events {

/**
 * @brief Logs every upload lifecycle event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionCreatedEvent>([this](const SessionCreatedEvent& e) {
            on_session_created(e);
        });

        bus_.subscribe<FragmentReceivedEvent>([this](const FragmentReceivedEvent& e) {
            on_fragment_received(e);
        });

        bus_.subscribe<SessionCommittedEvent>([this](const SessionCommittedEvent& e) {
            on_session_committed(e);
        });

        bus_.subscribe<SessionCancelledEvent>([this](const SessionCancelledEvent& e) {
            on_session_cancelled(e);
        });

        bus_.subscribe<SessionFailedEvent>([this](const SessionFailedEvent& e) {
            on_session_failed(e);
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent& e) {
            on_session_expired(e);
        });

        bus_.subscribe<RequestRejectedEvent>([this](const RequestRejectedEvent& e) {
            on_request_rejected(e);
        });

        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });
    }

private:
    void on_session_created(const SessionCreatedEvent& e) {
        spdlog::info("[SessionCreated] session={} target={}", e.session_id, e.target_path);
    }

    void on_fragment_received(const FragmentReceivedEvent& e) {
        spdlog::debug("[FragmentReceived] session={} range=[{}, {}) total={} prefix={}",
                      e.session_id, e.range.start, e.range.end, e.total_size, e.received_prefix);
    }

    void on_session_committed(const SessionCommittedEvent& e) {
        spdlog::info("[SessionCommitted] session={} target={} bytes={} duration={}ms",
                     e.session_id, e.target_path, e.total_bytes, e.duration.count());
    }

    void on_session_cancelled(const SessionCancelledEvent& e) {
        spdlog::info("[SessionCancelled] session={} target={}", e.session_id, e.target_path);
    }

    void on_session_failed(const SessionFailedEvent& e) {
        spdlog::error("[SessionFailed] session={} kind={} reason={}",
                      e.session_id, upload::to_string(e.kind), e.reason);
    }

    void on_session_expired(const SessionExpiredEvent& e) {
        spdlog::warn("[SessionExpired] session={} idle_limit={}s", e.session_id, e.idle_limit.count());
    }

    void on_request_rejected(const RequestRejectedEvent& e) {
        spdlog::warn("[RequestRejected] packet={} session={} kind={} message={}",
                     e.packet_type, e.session_id.empty() ? "-" : e.session_id,
                     upload::to_string(e.kind), e.message);
    }

    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("BITS upload server started on port {}", e.port);
        spdlog::info("Upload root: {}", e.upload_root);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Counts upload lifecycle events
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_created{0};
        std::atomic<uint64_t> sessions_committed{0};
        std::atomic<uint64_t> sessions_cancelled{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> sessions_expired{0};
        std::atomic<uint64_t> fragments_received{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> bytes_committed{0};
        std::atomic<uint64_t> requests_rejected{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionCreatedEvent>([this](const SessionCreatedEvent&) {
            stats_.sessions_created++;
        });

        bus_.subscribe<FragmentReceivedEvent>([this](const FragmentReceivedEvent& e) {
            stats_.fragments_received++;
            stats_.bytes_received += e.range.length();
        });

        bus_.subscribe<SessionCommittedEvent>([this](const SessionCommittedEvent& e) {
            stats_.sessions_committed++;
            stats_.bytes_committed += e.total_bytes;
        });

        bus_.subscribe<SessionCancelledEvent>([this](const SessionCancelledEvent&) {
            stats_.sessions_cancelled++;
        });

        bus_.subscribe<SessionFailedEvent>([this](const SessionFailedEvent&) {
            stats_.sessions_failed++;
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent&) {
            stats_.sessions_expired++;
        });

        bus_.subscribe<RequestRejectedEvent>([this](const RequestRejectedEvent&) {
            stats_.requests_rejected++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Sessions created:   {}", stats_.sessions_created.load());
        spdlog::info("  Sessions committed: {}", stats_.sessions_committed.load());
        spdlog::info("  Sessions cancelled: {}", stats_.sessions_cancelled.load());
        spdlog::info("  Sessions failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  Sessions expired:   {}", stats_.sessions_expired.load());
        spdlog::info("  Fragments received: {}", stats_.fragments_received.load());
        spdlog::info("  Bytes received:     {}", stats_.bytes_received.load());
        spdlog::info("  Bytes committed:    {}", stats_.bytes_committed.load());
        spdlog::info("  Requests rejected:  {}", stats_.requests_rejected.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace bitsd::events
