#pragma once

#include "bitsd/upload/fragment_store.hpp"
#include "bitsd/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bitsd::upload {

struct SessionOptions {
    std::uint64_t max_fragment_size = 100u * 1024u * 1024u;
    bool verify_retransmits = false;
};

/**
 * @brief Point-in-time view of a session
 */
struct UploadSessionInfo {
    std::string session_id;
    std::filesystem::path target_path;
    SessionState state = SessionState::Open;
    std::optional<std::uint64_t> declared_total_size;
    std::uint64_t received_bytes = 0;
    std::uint64_t received_prefix = 0;
    std::string last_error;  ///< Populated when state == Failed
};

/**
 * @brief One in-progress BITS upload
 *
 * Every operation takes the session's own mutex, so requests racing on one
 * session id are applied one after another while other sessions proceed in
 * parallel. State only moves forward: Open -> Committed | Cancelled | Failed.
 * The backing file exists exactly while the session is Open.
 */
class UploadSession {
public:
    using Clock = std::chrono::steady_clock;

    UploadSession(std::string session_id,
                  std::filesystem::path target_path,
                  std::unique_ptr<FragmentStore> store,
                  SessionOptions options = {});

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return session_id_; }
    [[nodiscard]] const std::filesystem::path& target_path() const noexcept { return target_path_; }
    [[nodiscard]] Clock::time_point created_at() const noexcept { return created_at_; }

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] Clock::time_point last_activity() const;
    [[nodiscard]] UploadSessionInfo info() const;

    /**
     * @brief Write one fragment at its absolute offset
     *
     * Fixes the declared total on the first fragment; a different total later
     * fails the session. Retransmitted ranges are accepted again.
     *
     * @return End of the contiguous received prefix
     */
    UploadResult<std::uint64_t> write_fragment(ByteRange range,
                                               std::uint64_t total_size,
                                               const std::vector<std::uint8_t>& payload);

    [[nodiscard]] bool is_fully_covered() const;

    /**
     * @brief Promote the backing file onto the target path
     *
     * Incomplete coverage leaves the session Open; a failed move fails it.
     */
    UploadResult<void> commit();

    UploadResult<void> cancel();

    /**
     * @brief Cancel only if nothing happened since @p cutoff
     *
     * @return true when this call cancelled the session
     */
    bool cancel_if_idle(Clock::time_point cutoff);

    /**
     * @brief Force the session into Failed, deleting its backing file
     */
    void fail(std::string reason);

private:
    bool is_fully_covered_locked() const;
    void cancel_locked();
    void fail_locked(std::string reason);
    void touch_locked();

    const std::string session_id_;
    const std::filesystem::path target_path_;
    const SessionOptions options_;
    const Clock::time_point created_at_;

    mutable std::mutex mutex_;
    std::unique_ptr<FragmentStore> store_;
    SessionState state_ = SessionState::Open;
    std::optional<std::uint64_t> declared_total_size_;
    std::uint64_t committed_bytes_ = 0;
    Clock::time_point last_activity_;
    std::string last_error_;
};

} // namespace bitsd::upload
