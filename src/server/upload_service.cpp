#include "bitsd/upload/service.hpp"

#include "bitsd/protocol/codec.hpp"
#include "bitsd/protocol/headers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>
#include <utility>
#include <variant>

namespace bitsd::upload {
namespace fs = std::filesystem;
using protocol::Outcome;
using protocol::OutcomeKind;

namespace {

fs::path canonical_or_normal(const fs::path& path) {
    std::error_code ec;
    auto resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        resolved = fs::absolute(path, ec).lexically_normal();
    }
    return resolved;
}

bool is_within(const fs::path& base, const fs::path& path) {
    const auto relative = path.lexically_relative(base);
    return !relative.empty() && *relative.begin() != "..";
}

} // namespace

UploadService::UploadService(fs::path upload_root,
                             SessionRegistry& registry,
                             events::EventBus& bus)
    : upload_root_(canonical_or_normal(upload_root)),
      staging_dir_(canonical_or_normal(registry.staging_dir())),
      registry_(registry),
      event_bus_(bus) {}

network::HttpResponse UploadService::handle_request(const network::HttpRequest& request) {
    if (request.method != network::HttpMethod::BITS_POST) {
        spdlog::debug("Refusing {} {}", network::HttpMethodUtils::to_string(request.method), request.url);
        network::HttpResponse response(network::HttpStatus::METHOD_NOT_ALLOWED);
        response.set_header("Allow", "BITS_POST");
        response.set_body("");
        return response;
    }
    return protocol::serialize_outcome(handle(protocol::parse_command(request)));
}

Outcome UploadService::handle(const protocol::Command& command) {
    Outcome outcome = std::visit([this](const auto& packet) { return dispatch(packet); }, command);
    if (outcome.kind == OutcomeKind::Rejected && outcome.error) {
        event_bus_.emit(events::RequestRejectedEvent{
            protocol::packet_name(command), outcome.session_id, outcome.error->kind, outcome.error->message});
    }
    return outcome;
}

std::size_t UploadService::expire_idle_sessions(std::chrono::seconds max_idle) {
    const auto expired = registry_.expire_idle(max_idle);
    for (const auto& session_id : expired) {
        event_bus_.emit(events::SessionExpiredEvent{session_id, max_idle});
    }
    return expired.size();
}

Outcome UploadService::dispatch(const protocol::CreateSession& command) {
    const auto& offered = command.supported_protocols;
    const std::string supported = protocol::kUploadProtocolGuid;
    if (!offered.empty() && std::find(offered.begin(), offered.end(), supported) == offered.end()) {
        return reject(UploadError{ErrorKind::ProtocolMismatch, "No supported protocol offered by the client"});
    }

    auto target = resolve_target(command.target);
    if (target.is_error()) {
        return reject(target.error());
    }

    auto created = registry_.create(target.value());
    if (created.is_error()) {
        return reject(created.error());
    }

    const auto& session = created.value();
    event_bus_.emit(events::SessionCreatedEvent{session->id(), session->target_path().string()});
    return Outcome::created(session->id(), supported);
}

Outcome UploadService::dispatch(const protocol::Fragment& command) {
    auto session = registry_.lookup(command.session_id);
    if (!session) {
        return reject(UploadError{ErrorKind::UnknownSession, "No such session"}, command.session_id);
    }

    auto written = session->write_fragment(command.range, command.total_size, command.payload);
    if (written.is_error()) {
        const auto& error = written.error();
        switch (error.kind) {
            case ErrorKind::SizeConflict:
            case ErrorKind::DataMismatch:
            case ErrorKind::Internal:
                retire_failed(command.session_id, error);
                break;
            case ErrorKind::NotOpen:
                registry_.remove(command.session_id);
                break;
            default:
                break;
        }
        return reject(error, command.session_id);
    }

    event_bus_.emit(events::FragmentReceivedEvent{
        command.session_id, command.range, command.total_size, written.value()});
    return Outcome::fragment_accepted(command.session_id, written.value());
}

Outcome UploadService::dispatch(const protocol::CloseSession& command) {
    auto session = registry_.lookup(command.session_id);
    if (!session) {
        return reject(UploadError{ErrorKind::UnknownSession, "No such session"}, command.session_id);
    }

    auto committed = session->commit();
    if (committed.is_error()) {
        const auto& error = committed.error();
        if (error.kind == ErrorKind::Internal) {
            retire_failed(command.session_id, error);
        } else if (error.kind == ErrorKind::NotOpen) {
            registry_.remove(command.session_id);
        }
        return reject(error, command.session_id);
    }

    registry_.remove(command.session_id);
    const auto info = session->info();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        UploadSession::Clock::now() - session->created_at());
    event_bus_.emit(events::SessionCommittedEvent{
        command.session_id, info.target_path.string(), info.received_bytes, elapsed});
    return Outcome::acknowledged(OutcomeKind::SessionClosed, command.session_id);
}

Outcome UploadService::dispatch(const protocol::CancelSession& command) {
    auto session = registry_.lookup(command.session_id);
    if (!session) {
        // Nothing to cancel; the client's intent already holds
        return Outcome::acknowledged(OutcomeKind::SessionCancelled, command.session_id);
    }

    auto cancelled = session->cancel();
    registry_.remove(command.session_id);
    if (cancelled.is_ok()) {
        event_bus_.emit(events::SessionCancelledEvent{command.session_id, session->target_path().string()});
    }
    return Outcome::acknowledged(OutcomeKind::SessionCancelled, command.session_id);
}

Outcome UploadService::dispatch(const protocol::Ping&) {
    return Outcome::acknowledged(OutcomeKind::PingAcknowledged);
}

Outcome UploadService::dispatch(const protocol::Malformed& command) {
    return reject(UploadError{ErrorKind::Malformed, command.reason}, command.session_id);
}

UploadResult<fs::path> UploadService::resolve_target(const std::string& url_path) const {
    std::string relative_text = url_path;
    relative_text.erase(0, relative_text.find_first_not_of('/'));
    if (relative_text.empty()) {
        return upload_error<fs::path>(ErrorKind::AccessDenied, "Request URL names no file");
    }

    const fs::path relative = fs::path(relative_text).lexically_normal();
    if (relative.has_root_path() || relative.empty() || *relative.begin() == "..") {
        return upload_error<fs::path>(ErrorKind::AccessDenied, "Target escapes the upload root: " + url_path);
    }
    if (!relative.has_filename()) {
        return upload_error<fs::path>(ErrorKind::AccessDenied, "Target is a directory: " + url_path);
    }

    // Resolve symlinked directories so the checks see where the file really lands
    const fs::path lexical = upload_root_ / relative;
    fs::path target = canonical_or_normal(lexical.parent_path()) / lexical.filename();
    if (!is_within(upload_root_, target)) {
        return upload_error<fs::path>(ErrorKind::AccessDenied, "Target escapes the upload root: " + url_path);
    }
    if (is_within(staging_dir_, target)) {
        return upload_error<fs::path>(ErrorKind::AccessDenied, "Target lies inside the staging directory: " + url_path);
    }
    return bitsd::Ok<fs::path, UploadError>(std::move(target));
}

Outcome UploadService::reject(UploadError error, std::string session_id) {
    return Outcome::rejected(std::move(error), std::move(session_id));
}

void UploadService::retire_failed(const std::string& session_id, const UploadError& error) {
    registry_.remove(session_id);
    event_bus_.emit(events::SessionFailedEvent{session_id, error.kind, error.message});
}

} // namespace bitsd::upload
