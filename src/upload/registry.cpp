#include "bitsd/upload/registry.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>
#include <system_error>

namespace bitsd::upload {
namespace fs = std::filesystem;

SessionRegistry::SessionRegistry(RegistryOptions options)
    : options_(std::move(options)) {}

bitsd::Result<std::size_t> SessionRegistry::prepare_staging() {
    std::error_code ec;
    fs::create_directories(options_.staging_dir, ec);
    if (ec) {
        return bitsd::Err<std::size_t>(
            std::string("Failed to create staging directory ") + options_.staging_dir.string() + ": " + ec.message());
    }

    std::size_t removed = 0;
    for (fs::directory_iterator it(options_.staging_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->path().extension() != kBackingExtension || !it->is_regular_file(entry_ec)) {
            continue;
        }
        if (fs::remove(it->path(), entry_ec)) {
            ++removed;
        }
    }
    if (ec) {
        return bitsd::Err<std::size_t>(
            std::string("Failed to scan staging directory ") + options_.staging_dir.string() + ": " + ec.message());
    }
    return bitsd::Ok(removed);
}

UploadResult<std::shared_ptr<UploadSession>> SessionRegistry::create(const fs::path& target) {
    using SessionPtr = std::shared_ptr<UploadSession>;

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        return upload_error<SessionPtr>(ErrorKind::AccessDenied, "Target is a directory: " + target.string());
    }
    if (!fs::is_directory(target.parent_path(), ec)) {
        return upload_error<SessionPtr>(ErrorKind::AccessDenied,
                                        "Target directory does not exist: " + target.parent_path().string());
    }

    const std::string key = target_key(target);
    std::string session_id;
    {
        std::unique_lock lock(mutex_);
        if (targets_.count(key) > 0) {
            return upload_error<SessionPtr>(ErrorKind::TargetInUse,
                                            "Target is being uploaded by another session: " + target.string());
        }
        do {
            session_id = generate_id();
        } while (sessions_.count(session_id) > 0);
        targets_.emplace(key, session_id);
    }

    // Backing file is created outside the lock; the target stays reserved
    const fs::path backing = options_.staging_dir / (session_id.substr(1, session_id.size() - 2) + kBackingExtension);
    auto store = FragmentStore::open(backing);
    if (store.is_error()) {
        std::unique_lock lock(mutex_);
        targets_.erase(key);
        return upload_error<SessionPtr>(store.error().kind, store.error().message);
    }

    auto session = std::make_shared<UploadSession>(session_id, target, std::move(store.value()), options_.session);
    {
        std::unique_lock lock(mutex_);
        sessions_.emplace(session_id, session);
    }
    return bitsd::Ok<SessionPtr, UploadError>(std::move(session));
}

std::shared_ptr<UploadSession> SessionRegistry::lookup(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

void SessionRegistry::remove(const std::string& session_id) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return;
    }
    auto target = targets_.find(target_key(it->second->target_path()));
    if (target != targets_.end() && target->second == session_id) {
        targets_.erase(target);
    }
    sessions_.erase(it);
}

std::vector<std::string> SessionRegistry::expire_idle(std::chrono::steady_clock::duration max_idle,
                                                      std::chrono::steady_clock::time_point now) {
    const auto cutoff = now - max_idle;

    std::vector<std::shared_ptr<UploadSession>> candidates;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            candidates.push_back(session);
        }
    }

    std::vector<std::string> expired;
    for (const auto& session : candidates) {
        if (session->cancel_if_idle(cutoff)) {
            remove(session->id());
            expired.push_back(session->id());
        }
    }
    return expired;
}

std::size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::target_in_use(const fs::path& target) const {
    std::shared_lock lock(mutex_);
    return targets_.count(target_key(target)) > 0;
}

std::string SessionRegistry::generate_id() {
    thread_local boost::uuids::random_generator generator;
    return "{" + boost::uuids::to_string(generator()) + "}";
}

std::string SessionRegistry::target_key(const fs::path& target) {
    return target.lexically_normal().string();
}

} // namespace bitsd::upload
