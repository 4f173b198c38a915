#pragma once

#include "bitsd/network/http_types.hpp"
#include "bitsd/protocol/command.hpp"
#include "bitsd/protocol/outcome.hpp"
#include "bitsd/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bitsd::protocol {

/**
 * @brief Parsed "Content-Range: bytes <first>-<last>/<total>" (inclusive last)
 */
struct ContentRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    std::uint64_t total = 0;

    [[nodiscard]] upload::ByteRange to_half_open() const noexcept { return {first, last + 1}; }
};

/**
 * @brief Parse a Content-Range value
 *
 * Requires first <= last < total; anything else (missing unit, "*",
 * signs, overflow, trailing text) yields nullopt.
 */
std::optional<ContentRange> parse_content_range(std::string_view value);

/**
 * @brief Validate a session id and bring it to canonical form
 *
 * Accepts the 8-4-4-4-12 hex layout with or without surrounding braces, in
 * any case. Returns the lower-case braced form.
 */
std::optional<std::string> normalize_session_id(std::string_view value);

/**
 * @brief Percent-decode the path part of a request URL
 *
 * Query and fragment are dropped; invalid escapes and embedded NULs yield
 * nullopt.
 */
std::optional<std::string> decode_target_path(std::string_view url);

std::vector<std::string> split_protocol_list(std::string_view value);

/**
 * @brief Turn a BITS_POST request into a command
 *
 * Never throws; every validation failure becomes Malformed.
 */
Command parse_command(const network::HttpRequest& request);

network::HttpStatus status_for(upload::ErrorKind kind) noexcept;
std::uint32_t error_code_for(upload::ErrorKind kind) noexcept;

/**
 * @brief "0x80070057" style rendering used in BITS-Error-* headers
 */
std::string format_hresult(std::uint32_t value);

/**
 * @brief Build the acknowledgement for @p outcome
 */
network::HttpResponse serialize_outcome(const Outcome& outcome);

} // namespace bitsd::protocol
