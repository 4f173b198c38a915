#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "http_parser.hpp"
#include "http_types.hpp"
#include <array>
#include <functional>
#include <memory>
#include <string>

namespace bitsd {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. Each complete request is handed to the handler and answered
 * 4. Persistent connections loop back to reading; others are shut down
 *
 * BITS clients send every fragment of a job over one keep-alive
 * connection, so requests on a connection are processed strictly in order.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();

    /**
     * @brief Feed bytes to the parser and dispatch any completed request
     */
    void consume(const char* data, std::size_t length);

    void process_request();

    void do_write(const HttpResponse& response, bool keep_alive);

    void handle_error(const ParseError& error);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
    std::string pending_;                   // bytes received past the current request
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Thread safety:
 * - io_context::run() may be called from several threads; each connection's
 *   operations are chained, so one connection never runs concurrently with
 *   itself while different connections are handled in parallel
 * - The handler is called from io_context thread(s) and must be thread-safe
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 8080);
 * server.set_handler([&service](const HttpRequest& req) {
 *     return service.handle_request(req);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @brief Bind and start accepting
     *
     * @throws boost::system::system_error when the endpoint cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context,
                   uint16_t port,
                   const std::string& address = "0.0.0.0",
                   std::size_t max_body_size = HttpParser::kDefaultMaxBodySize);

    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Port actually bound (useful when constructed with port 0)
     */
    uint16_t get_port() const { return port_; }

    /**
     * @brief Stop accepting new connections
     */
    void close();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_size_;
    uint16_t port_;
};

/**
 * @brief Run @p io_context on @p threads threads (the caller's included)
 *
 * A handler that throws is logged and stops the io_context, so every thread
 * returns and is joined before this function does.
 */
void run_io_context(asio::io_context& io_context, unsigned threads);

} // namespace network
} // namespace bitsd
