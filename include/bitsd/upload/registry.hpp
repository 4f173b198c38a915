#pragma once

#include "bitsd/core/result.hpp"
#include "bitsd/upload/session.hpp"
#include "bitsd/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bitsd::upload {

struct RegistryOptions {
    std::filesystem::path staging_dir;
    SessionOptions session;
};

/**
 * @brief Concurrency-safe map of open upload sessions
 *
 * The registry lock covers only map mutations and lookups; backing files
 * are opened, written and removed outside it. Sessions are handed out as
 * shared_ptr so a request still holding one can finish after the entry was
 * removed.
 *
 * At most one open session may target a given path.
 */
class SessionRegistry {
public:
    explicit SessionRegistry(RegistryOptions options);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Create the staging directory and delete backing files left by
     *        an earlier process
     *
     * @return Number of stale files removed
     */
    bitsd::Result<std::size_t> prepare_staging();

    /**
     * @brief Open a new session uploading to @p target
     *
     * Fails with AccessDenied when @p target is a directory or its parent does
     * not exist, TargetInUse when another open session owns @p target, and
     * Internal when the backing file cannot be created.
     */
    UploadResult<std::shared_ptr<UploadSession>> create(const std::filesystem::path& target);

    [[nodiscard]] std::shared_ptr<UploadSession> lookup(const std::string& session_id) const;

    /**
     * @brief Drop @p session_id (no-op when absent)
     */
    void remove(const std::string& session_id);

    /**
     * @brief Cancel and remove sessions idle for longer than @p max_idle
     *
     * @return Ids of the sessions that were expired
     */
    std::vector<std::string> expire_idle(std::chrono::steady_clock::duration max_idle,
                                         std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool target_in_use(const std::filesystem::path& target) const;
    [[nodiscard]] const std::filesystem::path& staging_dir() const noexcept { return options_.staging_dir; }

    /**
     * @brief New random session id, "{xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}"
     */
    static std::string generate_id();

    static constexpr const char* kBackingExtension = ".part";

private:
    static std::string target_key(const std::filesystem::path& target);

    RegistryOptions options_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
    std::unordered_map<std::string, std::string> targets_;   // target key -> session id
};

} // namespace bitsd::upload
