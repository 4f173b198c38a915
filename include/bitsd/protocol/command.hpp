#pragma once

#include "bitsd/upload/types.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace bitsd::protocol {

struct CreateSession {
    std::string target;                           ///< Decoded URL path, relative to the upload root
    std::vector<std::string> supported_protocols; ///< Empty when the client sent none
};

struct Fragment {
    std::string session_id;
    upload::ByteRange range;                      ///< Half-open, converted from the inclusive header
    std::uint64_t total_size = 0;
    std::vector<std::uint8_t> payload;
};

struct CloseSession {
    std::string session_id;
};

struct CancelSession {
    std::string session_id;
};

struct Ping {};

struct Malformed {
    std::string reason;
    std::string session_id;                       ///< Echoed back when the request carried a valid one
};

/**
 * @brief One decoded BITS packet
 *
 * Closed set: the dispatcher visits every alternative.
 */
using Command = std::variant<CreateSession, Fragment, CloseSession, CancelSession, Ping, Malformed>;

// BITS-Packet-Type value of @p command ("Malformed" for undecodable requests)
const char* packet_name(const Command& command);

} // namespace bitsd::protocol
