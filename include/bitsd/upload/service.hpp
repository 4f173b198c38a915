#pragma once

#include "bitsd/events/event_bus.hpp"
#include "bitsd/events/events.hpp"
#include "bitsd/network/http_types.hpp"
#include "bitsd/protocol/command.hpp"
#include "bitsd/protocol/outcome.hpp"
#include "bitsd/upload/registry.hpp"
#include "bitsd/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace bitsd::upload {

/**
 * @brief BITS session state machine
 *
 * Turns decoded packets into registry and session operations and reports
 * each result as an Outcome. Nothing thrown by the storage layer escapes;
 * every failure becomes a rejection with an error category.
 *
 * Safe to call from any number of io_context threads at once.
 */
class UploadService {
public:
    UploadService(std::filesystem::path upload_root,
                  SessionRegistry& registry,
                  events::EventBus& bus);

    /**
     * @brief Full request path: method check, decode, dispatch, encode
     */
    network::HttpResponse handle_request(const network::HttpRequest& request);

    /**
     * @brief Dispatch one decoded packet
     *
     * Rejections are published as RequestRejectedEvent tagged with the
     * packet name.
     */
    protocol::Outcome handle(const protocol::Command& command);

    /**
     * @brief Cancel sessions idle for longer than @p max_idle
     *
     * @return Number of sessions expired
     */
    std::size_t expire_idle_sessions(std::chrono::seconds max_idle);

    [[nodiscard]] const std::filesystem::path& upload_root() const noexcept { return upload_root_; }

private:
    protocol::Outcome dispatch(const protocol::CreateSession& command);
    protocol::Outcome dispatch(const protocol::Fragment& command);
    protocol::Outcome dispatch(const protocol::CloseSession& command);
    protocol::Outcome dispatch(const protocol::CancelSession& command);
    protocol::Outcome dispatch(const protocol::Ping& command);
    protocol::Outcome dispatch(const protocol::Malformed& command);

    /**
     * @brief Map a decoded URL path onto a file below the upload root
     *
     * Paths leaving the root, naming a directory, or pointing into the
     * staging directory are denied.
     */
    UploadResult<std::filesystem::path> resolve_target(const std::string& url_path) const;

    static protocol::Outcome reject(UploadError error, std::string session_id = {});

    // Drops a session that left the Open state as a side effect of a failure
    void retire_failed(const std::string& session_id, const UploadError& error);

    std::filesystem::path upload_root_;
    std::filesystem::path staging_dir_;
    SessionRegistry& registry_;
    events::EventBus& event_bus_;
};

} // namespace bitsd::upload
