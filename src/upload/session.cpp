#include "bitsd/upload/session.hpp"

namespace bitsd::upload {

UploadSession::UploadSession(std::string session_id,
                             std::filesystem::path target_path,
                             std::unique_ptr<FragmentStore> store,
                             SessionOptions options)
    : session_id_(std::move(session_id)),
      target_path_(std::move(target_path)),
      options_(options),
      created_at_(Clock::now()),
      store_(std::move(store)),
      last_activity_(created_at_) {}

SessionState UploadSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

UploadSession::Clock::time_point UploadSession::last_activity() const {
    std::lock_guard lock(mutex_);
    return last_activity_;
}

UploadSessionInfo UploadSession::info() const {
    std::lock_guard lock(mutex_);
    UploadSessionInfo info;
    info.session_id = session_id_;
    info.target_path = target_path_;
    info.state = state_;
    info.declared_total_size = declared_total_size_;
    info.last_error = last_error_;
    if (store_) {
        info.received_bytes = store_->ranges().total_bytes();
        info.received_prefix = store_->ranges().contiguous_prefix();
    } else if (state_ == SessionState::Committed) {
        info.received_bytes = committed_bytes_;
        info.received_prefix = committed_bytes_;
    }
    return info;
}

UploadResult<std::uint64_t> UploadSession::write_fragment(ByteRange range,
                                                          std::uint64_t total_size,
                                                          const std::vector<std::uint8_t>& payload) {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Open) {
        return upload_error<std::uint64_t>(ErrorKind::NotOpen, "No active session " + session_id_);
    }

    if (range.empty() || range.end > total_size) {
        return upload_error<std::uint64_t>(ErrorKind::Malformed, "Fragment range outside declared total");
    }
    if (payload.size() != range.length()) {
        return upload_error<std::uint64_t>(ErrorKind::Malformed,
            "Fragment carries " + std::to_string(payload.size()) + " bytes for a range of " +
            std::to_string(range.length()));
    }
    if (range.length() > options_.max_fragment_size) {
        return upload_error<std::uint64_t>(ErrorKind::TooLarge,
            "Fragment of " + std::to_string(range.length()) + " bytes exceeds limit of " +
            std::to_string(options_.max_fragment_size));
    }

    if (declared_total_size_ && *declared_total_size_ != total_size) {
        const std::string reason = "Fragment declares total " + std::to_string(total_size) +
                                   " but session total is " + std::to_string(*declared_total_size_);
        fail_locked(reason);
        return upload_error<std::uint64_t>(ErrorKind::SizeConflict, reason);
    }

    if (options_.verify_retransmits) {
        auto same = store_->matches_received(range, payload);
        if (same.is_error()) {
            fail_locked(same.error().message);
            return upload_error<std::uint64_t>(ErrorKind::Internal, same.error().message);
        }
        if (!same.value()) {
            const std::string reason = "Retransmitted bytes in [" + std::to_string(range.start) + ", " +
                                       std::to_string(range.end) + ") differ from earlier data";
            fail_locked(reason);
            return upload_error<std::uint64_t>(ErrorKind::DataMismatch, reason);
        }
    }

    auto written = store_->write(range, payload);
    if (written.is_error()) {
        fail_locked(written.error().message);
        return upload_error<std::uint64_t>(ErrorKind::Internal, written.error().message);
    }

    declared_total_size_ = total_size;
    touch_locked();
    return bitsd::Ok<std::uint64_t, UploadError>(store_->ranges().contiguous_prefix());
}

bool UploadSession::is_fully_covered() const {
    std::lock_guard lock(mutex_);
    return is_fully_covered_locked();
}

UploadResult<void> UploadSession::commit() {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Open) {
        return upload_error(ErrorKind::NotOpen, "No active session " + session_id_);
    }

    if (!is_fully_covered_locked()) {
        touch_locked();
        const auto received = store_->ranges().total_bytes();
        return upload_error(ErrorKind::Incomplete,
            "Incomplete upload: received " + std::to_string(received) + " of " +
            (declared_total_size_ ? std::to_string(*declared_total_size_) : std::string("unknown")) + " bytes");
    }

    auto promoted = store_->promote(target_path_);
    if (promoted.is_error()) {
        fail_locked(promoted.error().message);
        return promoted;
    }

    committed_bytes_ = *declared_total_size_;
    store_.reset();
    state_ = SessionState::Committed;
    touch_locked();
    return upload_ok();
}

UploadResult<void> UploadSession::cancel() {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Open) {
        return upload_error(ErrorKind::NotOpen, "No active session " + session_id_);
    }
    cancel_locked();
    return upload_ok();
}

bool UploadSession::cancel_if_idle(Clock::time_point cutoff) {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Open || last_activity_ >= cutoff) {
        return false;
    }
    cancel_locked();
    return true;
}

void UploadSession::fail(std::string reason) {
    std::lock_guard lock(mutex_);
    if (state_ == SessionState::Open) {
        fail_locked(std::move(reason));
    }
}

bool UploadSession::is_fully_covered_locked() const {
    return store_ && declared_total_size_ && store_->ranges().covers(*declared_total_size_);
}

void UploadSession::cancel_locked() {
    store_->discard();
    store_.reset();
    state_ = SessionState::Cancelled;
    touch_locked();
}

void UploadSession::fail_locked(std::string reason) {
    if (store_) {
        store_->discard();
        store_.reset();
    }
    last_error_ = std::move(reason);
    state_ = SessionState::Failed;
    touch_locked();
}

void UploadSession::touch_locked() {
    last_activity_ = Clock::now();
}

} // namespace bitsd::upload
