#pragma once

#include <cstdint>

namespace bitsd::protocol {

// Header names
inline constexpr const char* kPacketType = "BITS-Packet-Type";
inline constexpr const char* kSessionId = "BITS-Session-Id";
inline constexpr const char* kSupportedProtocols = "BITS-Supported-Protocols";
inline constexpr const char* kProtocol = "BITS-Protocol";
inline constexpr const char* kErrorCode = "BITS-Error-Code";
inline constexpr const char* kErrorContext = "BITS-Error-Context";
inline constexpr const char* kReceivedContentRange = "BITS-Received-Content-Range";
inline constexpr const char* kContentRange = "Content-Range";
inline constexpr const char* kContentLength = "Content-Length";
inline constexpr const char* kAcceptEncoding = "Accept-Encoding";

// Packet type values (compared case-insensitively)
inline constexpr const char* kPacketCreateSession = "Create-Session";
inline constexpr const char* kPacketFragment = "Fragment";
inline constexpr const char* kPacketCloseSession = "Close-Session";
inline constexpr const char* kPacketCancelSession = "Cancel-Session";
inline constexpr const char* kPacketPing = "Ping";
inline constexpr const char* kPacketAck = "Ack";

/// The only BITS upload protocol version defined to date
inline constexpr const char* kUploadProtocolGuid = "{7df0354d-249b-430f-820d-3d2a9bef4931}";

// BITS-Error-Context: the error concerns the remote file
inline constexpr std::uint32_t kContextRemoteFile = 0x5;

// BITS-Error-Code HRESULTs
inline constexpr std::uint32_t kErrorGeneric = 0x1;
inline constexpr std::uint32_t kErrorAccessDenied = 0x80070005;        // E_ACCESSDENIED
inline constexpr std::uint32_t kErrorSharingViolation = 0x80070020;    // HRESULT_FROM_WIN32(ERROR_SHARING_VIOLATION)
inline constexpr std::uint32_t kErrorHandleEof = 0x80070026;           // HRESULT_FROM_WIN32(ERROR_HANDLE_EOF)
inline constexpr std::uint32_t kErrorInvalidArg = 0x80070057;          // E_INVALIDARG
inline constexpr std::uint32_t kErrorNotFound = 0x80070490;            // HRESULT_FROM_WIN32(ERROR_NOT_FOUND)
inline constexpr std::uint32_t kErrorTooLarge = 0x80200020;            // BG_E_TOO_LARGE

} // namespace bitsd::protocol
