#include "bitsd/protocol/codec.hpp"
#include "bitsd/protocol/headers.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace bitsd::protocol {

using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;
using upload::ErrorKind;

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// Consumes a run of decimal digits from the front of @p text
std::optional<std::uint64_t> take_number(std::string_view& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc()) {
        return std::nullopt;
    }
    text.remove_prefix(static_cast<std::size_t>(ptr - text.data()));
    return value;
}

bool take_char(std::string_view& text, char expected) {
    if (text.empty() || text.front() != expected) {
        return false;
    }
    text.remove_prefix(1);
    return true;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Malformed malformed(std::string reason, std::string session_id = {}) {
    return Malformed{std::move(reason), std::move(session_id)};
}

} // namespace

std::optional<ContentRange> parse_content_range(std::string_view value) {
    value = trim(value);

    constexpr std::string_view unit = "bytes";
    if (value.size() <= unit.size() || to_lower(value.substr(0, unit.size())) != unit ||
        !std::isspace(static_cast<unsigned char>(value[unit.size()]))) {
        return std::nullopt;
    }
    value = trim(value.substr(unit.size()));

    ContentRange range;
    auto first = take_number(value);
    if (!first || !take_char(value, '-')) {
        return std::nullopt;
    }
    auto last = take_number(value);
    if (!last || !take_char(value, '/')) {
        return std::nullopt;
    }
    auto total = take_number(value);
    if (!total || !value.empty()) {
        return std::nullopt;
    }

    range.first = *first;
    range.last = *last;
    range.total = *total;
    if (range.first > range.last || range.last >= range.total) {
        return std::nullopt;
    }
    return range;
}

std::optional<std::string> normalize_session_id(std::string_view value) {
    value = trim(value);
    if (!value.empty() && value.front() == '{') {
        if (value.back() != '}') {
            return std::nullopt;
        }
        value = value.substr(1, value.size() - 2);
    }

    if (value.size() != 36) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        const bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_position ? value[i] != '-' : hex_value(value[i]) < 0) {
            return std::nullopt;
        }
    }
    return "{" + to_lower(value) + "}";
}

std::optional<std::string> decode_target_path(std::string_view url) {
    const auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }

    std::string decoded;
    decoded.reserve(url.size());
    for (std::size_t i = 0; i < url.size(); ++i) {
        if (url[i] != '%') {
            decoded += url[i];
            continue;
        }
        if (i + 2 >= url.size()) {
            return std::nullopt;
        }
        const int high = hex_value(url[i + 1]);
        const int low = hex_value(url[i + 2]);
        if (high < 0 || low < 0 || (high == 0 && low == 0)) {
            return std::nullopt;
        }
        decoded += static_cast<char>(high * 16 + low);
        i += 2;
    }
    return decoded;
}

std::vector<std::string> split_protocol_list(std::string_view value) {
    std::vector<std::string> protocols;
    std::size_t start = 0;
    while (start < value.size()) {
        const auto end = value.find_first_of(", \t", start);
        const auto token = value.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!token.empty()) {
            protocols.push_back(to_lower(token));
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return protocols;
}

Command parse_command(const HttpRequest& request) {
    if (!request.has_header(kPacketType)) {
        return malformed("Missing BITS-Packet-Type header");
    }
    const std::string packet = to_lower(trim(request.get_header(kPacketType)));

    if (packet == "ping") {
        return Ping{};
    }

    if (packet == "create-session") {
        auto target = decode_target_path(request.url);
        if (!target) {
            return malformed("Invalid request URL: " + request.url);
        }
        return CreateSession{std::move(*target), split_protocol_list(request.get_header(kSupportedProtocols))};
    }

    if (packet != "fragment" && packet != "close-session" && packet != "cancel-session") {
        return malformed("Unknown BITS-Packet-Type: " + request.get_header(kPacketType));
    }

    if (!request.has_header(kSessionId)) {
        return malformed("Missing BITS-Session-Id header");
    }
    auto session_id = normalize_session_id(request.get_header(kSessionId));
    if (!session_id) {
        return malformed("Invalid BITS-Session-Id: " + request.get_header(kSessionId));
    }

    if (packet == "close-session") {
        return CloseSession{std::move(*session_id)};
    }
    if (packet == "cancel-session") {
        return CancelSession{std::move(*session_id)};
    }

    if (!request.has_header(kContentRange)) {
        return malformed("Missing Content-Range header", *session_id);
    }
    auto range = parse_content_range(request.get_header(kContentRange));
    if (!range) {
        return malformed("Invalid Content-Range: " + request.get_header(kContentRange), *session_id);
    }

    Fragment fragment;
    fragment.session_id = std::move(*session_id);
    fragment.range = range->to_half_open();
    fragment.total_size = range->total;
    fragment.payload = request.body;
    return fragment;
}

HttpStatus status_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnknownSession:
        case ErrorKind::NotOpen:
            return HttpStatus::NOT_FOUND;
        case ErrorKind::Malformed:
        case ErrorKind::SizeConflict:
        case ErrorKind::DataMismatch:
        case ErrorKind::Incomplete:
        case ErrorKind::ProtocolMismatch:
            return HttpStatus::BAD_REQUEST;
        case ErrorKind::AccessDenied:
            return HttpStatus::FORBIDDEN;
        case ErrorKind::TargetInUse:
            return HttpStatus::CONFLICT;
        case ErrorKind::TooLarge:
        case ErrorKind::Internal:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

std::uint32_t error_code_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnknownSession:
        case ErrorKind::NotOpen:
            return kErrorNotFound;
        case ErrorKind::Malformed:
        case ErrorKind::SizeConflict:
        case ErrorKind::DataMismatch:
        case ErrorKind::ProtocolMismatch:
            return kErrorInvalidArg;
        case ErrorKind::Incomplete:
            return kErrorHandleEof;
        case ErrorKind::AccessDenied:
            return kErrorAccessDenied;
        case ErrorKind::TargetInUse:
            return kErrorSharingViolation;
        case ErrorKind::TooLarge:
            return kErrorTooLarge;
        case ErrorKind::Internal:
            return kErrorGeneric;
    }
    return kErrorGeneric;
}

std::string format_hresult(std::uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

HttpResponse serialize_outcome(const Outcome& outcome) {
    HttpStatus status = HttpStatus::OK;
    if (outcome.kind == OutcomeKind::SessionCreated) {
        status = HttpStatus::CREATED;
    } else if (outcome.kind == OutcomeKind::Rejected) {
        status = status_for(outcome.error ? outcome.error->kind : ErrorKind::Internal);
    }

    HttpResponse response(status);
    response.set_header(kPacketType, kPacketAck);
    response.set_body("");
    if (!outcome.session_id.empty()) {
        response.set_header(kSessionId, outcome.session_id);
    }

    switch (outcome.kind) {
        case OutcomeKind::SessionCreated:
            response.set_header(kProtocol, outcome.protocol);
            response.set_header(kAcceptEncoding, "identity");
            break;
        case OutcomeKind::FragmentAccepted:
            response.set_header(kReceivedContentRange, std::to_string(outcome.received_prefix.value_or(0)));
            break;
        case OutcomeKind::Rejected: {
            const ErrorKind kind = outcome.error ? outcome.error->kind : ErrorKind::Internal;
            response.set_header(kErrorCode, format_hresult(error_code_for(kind)));
            response.set_header(kErrorContext, format_hresult(kContextRemoteFile));
            break;
        }
        case OutcomeKind::SessionClosed:
        case OutcomeKind::SessionCancelled:
        case OutcomeKind::PingAcknowledged:
            break;
    }

    return response;
}

} // namespace bitsd::protocol
