/**
 * @file main.cpp
 * @brief bitsd: BITS upload server
 *
 * Run with:
 *   ./build/bitsd 8080 --root /srv/uploads
 *
 * Windows clients upload with:
 *   bitsadmin /transfer job /upload http://host:8080/name.bin C:\path\name.bin
 */

#include "bitsd/core/config.hpp"
#include "bitsd/events/components.hpp"
#include "bitsd/events/event_bus.hpp"
#include "bitsd/events/events.hpp"
#include "bitsd/network/http_server_asio.hpp"
#include "bitsd/upload/registry.hpp"
#include "bitsd/upload/service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>

namespace asio = boost::asio;

namespace {

/**
 * @brief Periodically cancels sessions that stopped receiving packets
 */
class IdleSweeper {
public:
    IdleSweeper(asio::io_context& io_context,
                bitsd::upload::UploadService& service,
                std::chrono::seconds idle_timeout,
                std::chrono::seconds interval)
        : timer_(io_context),
          service_(service),
          idle_timeout_(idle_timeout),
          interval_(interval) {}

    void start() { schedule(); }

    void stop() { timer_.cancel(); }

private:
    void schedule() {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec) {
                return;  // cancelled at shutdown
            }
            const auto expired = service_.expire_idle_sessions(idle_timeout_);
            if (expired > 0) {
                spdlog::debug("Idle sweep expired {} session(s)", expired);
            }
            schedule();
        });
    }

    asio::steady_timer timer_;
    bitsd::upload::UploadService& service_;
    std::chrono::seconds idle_timeout_;
    std::chrono::seconds interval_;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = bitsd::parse_command_line(argc, argv);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error());
        std::cerr << bitsd::usage(argv[0]);
        return 1;
    }
    const bitsd::ServerConfig config = parsed.value();
    if (config.show_help) {
        std::cout << bitsd::usage(argv[0]);
        return 0;
    }

    auto valid = bitsd::validate(config);
    if (valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error());
        return 1;
    }
    spdlog::set_level(*bitsd::parse_log_level(config.log_level));

    bitsd::events::EventBus event_bus;
    bitsd::events::LoggerComponent logger(event_bus);
    bitsd::events::MetricsComponent metrics(event_bus);

    bitsd::upload::RegistryOptions registry_options;
    registry_options.staging_dir = config.staging_dir;
    registry_options.session.max_fragment_size = config.max_fragment_size;
    registry_options.session.verify_retransmits = config.verify_retransmits;

    bitsd::upload::SessionRegistry registry(registry_options);
    auto staged = registry.prepare_staging();
    if (staged.is_error()) {
        spdlog::error("{}", staged.error());
        return 1;
    }
    if (staged.value() > 0) {
        spdlog::info("Removed {} stale partial upload(s) from {}", staged.value(), config.staging_dir.string());
    }

    bitsd::upload::UploadService service(config.upload_root, registry, event_bus);

    try {
        asio::io_context io_context;

        bitsd::network::HttpServerAsio server(io_context,
                                              config.port,
                                              config.bind_address,
                                              static_cast<std::size_t>(config.request_body_limit()));
        server.set_handler([&service](const bitsd::network::HttpRequest& request) {
            return service.handle_request(request);
        });

        IdleSweeper sweeper(io_context, service, config.idle_timeout, config.sweep_interval);
        if (config.idle_timeout.count() > 0) {
            sweeper.start();
        }

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            event_bus.emit(bitsd::events::ServerShuttingDownEvent{
                signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
            server.close();
            sweeper.stop();
            io_context.stop();
        });

        event_bus.emit(bitsd::events::ServerStartedEvent{server.get_port(), service.upload_root().string()});
        spdlog::info("Listening on {}:{} with {} worker thread(s)",
                     config.bind_address, server.get_port(), config.worker_threads);
        spdlog::info("Staging directory: {}", config.staging_dir.string());

        bitsd::network::run_io_context(io_context, config.worker_threads);
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }

    // Sessions still open at exit cannot be resumed; drop their partial files
    const auto abandoned = service.expire_idle_sessions(std::chrono::seconds(0));
    if (abandoned > 0) {
        spdlog::info("Discarded {} unfinished upload(s)", abandoned);
    }

    metrics.print_stats();
    spdlog::info("Server shut down cleanly");
    return 0;
}
