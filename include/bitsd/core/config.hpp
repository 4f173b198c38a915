#pragma once

#include "bitsd/core/result.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bitsd {

/**
 * @brief Everything the bitsd executable can be told at startup
 *
 * Built from defaults, then an optional JSON file, then command-line flags
 * (later sources win).
 */
struct ServerConfig {
    std::uint16_t port = 8080;
    std::string bind_address = "0.0.0.0";
    std::filesystem::path upload_root;
    std::filesystem::path staging_dir;
    std::uint64_t max_fragment_size = 100u * 1024u * 1024u;
    std::optional<std::uint64_t> max_request_body;   ///< Defaults to twice max_fragment_size
    std::chrono::seconds idle_timeout{0};            ///< 0 disables idle expiry
    std::chrono::seconds sweep_interval{30};
    unsigned worker_threads = 1;
    bool verify_retransmits = false;
    std::string log_level = "info";
    bool show_help = false;

    /**
     * @brief Defaults that depend on the environment: current directory,
     *        system temp directory, hardware concurrency
     */
    static ServerConfig defaults();

    [[nodiscard]] std::uint64_t request_body_limit() const;
};

/**
 * @brief Build a config from argv
 *
 * Accepts an optional positional port for compatibility with the classic
 * "server <port>" invocation. A "-c/--config <file>" flag is honoured before
 * the other flags regardless of its position.
 */
Result<ServerConfig> parse_command_line(int argc, const char* const argv[]);

/**
 * @brief Overlay the keys present in @p json onto @p config
 *
 * Unknown keys are rejected so typos do not go unnoticed.
 */
Result<void> apply_config_json(ServerConfig& config, const nlohmann::json& json);

Result<void> load_config_file(ServerConfig& config, const std::filesystem::path& path);

/**
 * @brief Reject combinations the server cannot run with
 */
Result<void> validate(const ServerConfig& config);

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

std::string usage(const std::string& program);

} // namespace bitsd
