#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>
#include <sstream>
#include <cstring>

#ifndef _WIN32
#include <strings.h>
#endif

namespace bitsd {
namespace network {

/**
 * @brief HTTP request methods understood by the parser
 *
 * BITS_POST is the extension verb that carries every BITS upload packet.
 * The plain verbs are parsed so the server can answer them with 405 instead
 * of a parse error.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // renamed to avoid Windows macro conflict
    HEAD,
    OPTIONS,
    BITS_POST,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief HTTP status codes produced by the server
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    BAD_REQUEST = 400,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

/**
 * @brief Represents a parsed HTTP request
 *
 * The body is kept as raw bytes: BITS fragments are arbitrary binary data.
 * Header names are stored as received; lookups are case-insensitive as
 * required by RFC 7230.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Get a header value (case-insensitive lookup)
     *
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        for (const auto& entry : headers) {
            if (strcasecmp_cross_platform(entry.first.c_str(), name.c_str()) == 0) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Whether the connection should stay open after the response
     *
     * HTTP/1.1 defaults to persistent connections unless the client sends
     * "Connection: close"; HTTP/1.0 needs an explicit "Connection: keep-alive".
     */
    bool keep_alive() const {
        const std::string connection = get_header("Connection");
        if (version == HttpVersion::HTTP_1_0) {
            return strcasecmp_cross_platform(connection.c_str(), "keep-alive") == 0;
        }
        return strcasecmp_cross_platform(connection.c_str(), "close") != 0;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

private:
    static int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
        return _stricmp(s1, s2);
#else
        return strcasecmp(s1, s2);
#endif
    }
};

/**
 * @brief Represents an HTTP response
 *
 * BITS acknowledgements carry everything in headers; most responses have an
 * empty body with "Content-Length: 0".
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /**
     * @brief Set response body from a string and update Content-Length
     */
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /**
     * @brief Header value by exact name, empty string when absent
     */
    std::string get_header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string{};
    }

    bool has_header(const std::string& name) const {
        return headers.find(name) != headers.end();
    }

    /**
     * @brief Serialize the response to HTTP/1.1 wire format
     *
     * Format:
     * HTTP/1.1 200 OK\r\n
     * BITS-Packet-Type: Ack\r\n
     * Content-Length: 0\r\n
     * \r\n
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;

        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }

        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::FORBIDDEN: return "Forbidden";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        if (method_str == "BITS_POST") return HttpMethod::BITS_POST;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            case HttpMethod::BITS_POST: return "BITS_POST";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace bitsd
