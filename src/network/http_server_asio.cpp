#include "bitsd/network/http_server_asio.hpp"
#include <spdlog/spdlog.h>

#include <thread>
#include <vector>

namespace bitsd {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                consume(buffer_.data(), bytes_transferred);
            } else if (ec == asio::error::eof) {
                spdlog::debug("Connection closed by peer");
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Read error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::consume(const char* data, std::size_t length) {
    auto parse_result = parser_.parse(data, length);

    if (parse_result.is_error()) {
        handle_error(parse_result.error());
        return;
    }

    if (!parse_result.value()) {
        do_read();
        return;
    }

    // Keep pipelined bytes for the next request on this connection
    const std::size_t used = parser_.bytes_consumed();
    pending_.assign(data + used, length - used);
    process_request();
}

void HttpConnection::process_request() {
    HttpRequest request = parser_.take_request();

    spdlog::info("{} {} HTTP/{} packet={}",
        HttpMethodUtils::to_string(request.method),
        request.url,
        request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0",
        request.get_header("BITS-Packet-Type"));

    const bool keep_alive = request.keep_alive();

    HttpResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Handler threw exception: {}", e.what());
        response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }

    do_write(response, keep_alive);
}

void HttpConnection::do_write(const HttpResponse& response, bool keep_alive) {
    auto self = shared_from_this();

    HttpResponse outgoing = response;
    if (!keep_alive) {
        outgoing.set_header("Connection", "close");
    }

    // Shared so the bytes outlive this call while the write is in flight
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(outgoing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr, keep_alive](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }

            spdlog::debug("Sent {} bytes", bytes_transferred);

            if (!keep_alive) {
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
                return;
            }

            parser_.reset();
            if (pending_.empty()) {
                do_read();
                return;
            }

            std::string leftover;
            leftover.swap(pending_);
            consume(leftover.data(), leftover.size());
        }
    );
}

void HttpConnection::handle_error(const ParseError& error) {
    spdlog::warn("Connection error: {}", error.message);
    do_write(create_error_response(error.status, error.message), false);
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message + "\n");
    response.set_header("Content-Type", "text/plain");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               uint16_t port,
                               const std::string& address,
                               std::size_t max_body_size)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , max_body_size_(max_body_size)
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server (Asio event-driven) listening on {}:{}", address, port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::close() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Failed to close acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }

            if (!ec) {
                spdlog::debug("Accepted new connection (Asio)");
                std::make_shared<HttpConnection>(
                    std::move(socket),
                    handler_,
                    max_body_size_
                )->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

// ──────────────────────────────────────────────────────────
// Worker threads
// ──────────────────────────────────────────────────────────

void run_io_context(asio::io_context& io_context, unsigned threads) {
    auto run = [&io_context] {
        try {
            io_context.run();
        } catch (const std::exception& e) {
            spdlog::error("io_context worker stopped by exception: {}", e.what());
            io_context.stop();
        }
    };

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < threads; ++i) {
        workers.emplace_back(run);
    }
    run();
    for (auto& worker : workers) {
        worker.join();
    }
}

} // namespace network
} // namespace bitsd
