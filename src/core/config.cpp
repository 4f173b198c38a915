#include "bitsd/core/config.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>

namespace bitsd {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
std::optional<T> parse_unsigned(const std::string& text) {
    T value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

Result<void> invalid(const std::string& what, const std::string& value) {
    return Err<void, std::string>("Invalid value for " + what + ": '" + value + "'");
}

Result<void> set_port(ServerConfig& config, const std::string& value) {
    auto port = parse_unsigned<std::uint16_t>(value);
    if (!port) {
        return invalid("port", value);
    }
    config.port = *port;
    return Ok();
}

Result<void> set_seconds(std::chrono::seconds& target, const std::string& what, const std::string& value) {
    auto seconds = parse_unsigned<std::uint32_t>(value);
    if (!seconds) {
        return invalid(what, value);
    }
    target = std::chrono::seconds(*seconds);
    return Ok();
}

// Handles one "--flag value" pair; @p value is the argument following it
Result<void> apply_flag(ServerConfig& config, const std::string& flag, const std::string& value) {
    if (flag == "-p" || flag == "--port") {
        return set_port(config, value);
    }
    if (flag == "-b" || flag == "--bind") {
        config.bind_address = value;
        return Ok();
    }
    if (flag == "-r" || flag == "--root") {
        config.upload_root = value;
        return Ok();
    }
    if (flag == "-s" || flag == "--staging") {
        config.staging_dir = value;
        return Ok();
    }
    if (flag == "--max-fragment") {
        auto size = parse_unsigned<std::uint64_t>(value);
        if (!size) {
            return invalid("max fragment size", value);
        }
        config.max_fragment_size = *size;
        return Ok();
    }
    if (flag == "--max-body") {
        auto size = parse_unsigned<std::uint64_t>(value);
        if (!size) {
            return invalid("max request body", value);
        }
        config.max_request_body = *size;
        return Ok();
    }
    if (flag == "--idle-timeout") {
        return set_seconds(config.idle_timeout, "idle timeout", value);
    }
    if (flag == "--sweep-interval") {
        return set_seconds(config.sweep_interval, "sweep interval", value);
    }
    if (flag == "-t" || flag == "--threads") {
        auto threads = parse_unsigned<unsigned>(value);
        if (!threads) {
            return invalid("worker threads", value);
        }
        config.worker_threads = *threads;
        return Ok();
    }
    if (flag == "-l" || flag == "--log-level") {
        config.log_level = value;
        return Ok();
    }
    return Err<void, std::string>("Unknown option: " + flag);
}

bool takes_value(const std::string& arg) {
    static const std::vector<std::string> flags = {
        "-p", "--port", "-b", "--bind", "-r", "--root", "-s", "--staging",
        "--max-fragment", "--max-body", "--idle-timeout", "--sweep-interval",
        "-t", "--threads", "-l", "--log-level", "-c", "--config"};
    for (const auto& flag : flags) {
        if (arg == flag) {
            return true;
        }
    }
    return false;
}

} // namespace

ServerConfig ServerConfig::defaults() {
    ServerConfig config;

    std::error_code ec;
    config.upload_root = fs::current_path(ec);
    if (ec) {
        config.upload_root = ".";
    }

    const fs::path temp = fs::temp_directory_path(ec);
    config.staging_dir = (ec ? fs::path(".") : temp) / "bitsd-staging";

    config.worker_threads = std::max(1u, std::thread::hardware_concurrency());
    return config;
}

std::uint64_t ServerConfig::request_body_limit() const {
    if (max_request_body) {
        return *max_request_body;
    }
    if (max_fragment_size > std::numeric_limits<std::uint64_t>::max() / 2) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return max_fragment_size * 2;
}

Result<ServerConfig> parse_command_line(int argc, const char* const argv[]) {
    ServerConfig config = ServerConfig::defaults();

    // Config file first so that every other flag overrides it
    for (int i = 1; i + 1 < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            auto loaded = load_config_file(config, argv[i + 1]);
            if (loaded.is_error()) {
                return Err<ServerConfig, std::string>(loaded.error());
            }
            break;
        }
    }

    bool positional_port_seen = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }
        if (arg == "--verify-retransmits") {
            config.verify_retransmits = true;
            continue;
        }
        if (takes_value(arg)) {
            if (i + 1 >= argc) {
                return Err<ServerConfig, std::string>("Option " + arg + " requires a value");
            }
            const std::string value = argv[++i];
            if (arg == "-c" || arg == "--config") {
                continue;
            }
            auto applied = apply_flag(config, arg, value);
            if (applied.is_error()) {
                return Err<ServerConfig, std::string>(applied.error());
            }
            continue;
        }
        if (!arg.empty() && arg[0] != '-' && !positional_port_seen) {
            auto applied = set_port(config, arg);
            if (applied.is_error()) {
                return Err<ServerConfig, std::string>(applied.error());
            }
            positional_port_seen = true;
            continue;
        }
        return Err<ServerConfig, std::string>("Unknown argument: " + arg);
    }

    return Ok(std::move(config));
}

Result<void> apply_config_json(ServerConfig& config, const json& document) {
    if (!document.is_object()) {
        return Err<void, std::string>("Config file must contain a JSON object");
    }

    try {
        for (const auto& [key, value] : document.items()) {
            if (key == "port") {
                const auto port = value.get<std::uint64_t>();
                if (port > std::numeric_limits<std::uint16_t>::max()) {
                    return invalid("port", value.dump());
                }
                config.port = static_cast<std::uint16_t>(port);
            } else if (key == "bind_address") {
                config.bind_address = value.get<std::string>();
            } else if (key == "upload_root") {
                config.upload_root = value.get<std::string>();
            } else if (key == "staging_dir") {
                config.staging_dir = value.get<std::string>();
            } else if (key == "max_fragment_size") {
                config.max_fragment_size = value.get<std::uint64_t>();
            } else if (key == "max_request_body") {
                config.max_request_body = value.get<std::uint64_t>();
            } else if (key == "idle_timeout") {
                config.idle_timeout = std::chrono::seconds(value.get<std::uint32_t>());
            } else if (key == "sweep_interval") {
                config.sweep_interval = std::chrono::seconds(value.get<std::uint32_t>());
            } else if (key == "worker_threads") {
                config.worker_threads = value.get<unsigned>();
            } else if (key == "verify_retransmits") {
                config.verify_retransmits = value.get<bool>();
            } else if (key == "log_level") {
                config.log_level = value.get<std::string>();
            } else {
                return Err<void, std::string>("Unknown config key: " + key);
            }
        }
    } catch (const json::exception& e) {
        return Err<void, std::string>(std::string("Invalid config value: ") + e.what());
    }
    return Ok();
}

Result<void> load_config_file(ServerConfig& config, const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<void, std::string>("Cannot open config file: " + path.string());
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return Err<void, std::string>("Config file is not valid JSON: " + path.string());
    }
    return apply_config_json(config, document);
}

Result<void> validate(const ServerConfig& config) {
    if (config.upload_root.empty()) {
        return Err<void, std::string>("Upload root must not be empty");
    }
    std::error_code ec;
    if (!fs::is_directory(config.upload_root, ec)) {
        return Err<void, std::string>("Upload root is not a directory: " + config.upload_root.string());
    }
    if (config.staging_dir.empty()) {
        return Err<void, std::string>("Staging directory must not be empty");
    }
    if (config.max_fragment_size == 0) {
        return Err<void, std::string>("Max fragment size must be positive");
    }
    if (config.request_body_limit() < config.max_fragment_size) {
        return Err<void, std::string>("Max request body must not be smaller than the max fragment size");
    }
    if (config.worker_threads == 0) {
        return Err<void, std::string>("At least one worker thread is required");
    }
    if (config.idle_timeout.count() > 0 && config.sweep_interval.count() == 0) {
        return Err<void, std::string>("Sweep interval must be positive when idle expiry is enabled");
    }
    if (!parse_log_level(config.log_level)) {
        return Err<void, std::string>("Unknown log level: " + config.log_level);
    }
    return Ok();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str falls back to "off" for unknown names
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [port] [options]\n"
        << "\n"
        << "Options:\n"
        << "  -p, --port <n>           Listen port (default 8080)\n"
        << "  -b, --bind <addr>        Bind address (default 0.0.0.0)\n"
        << "  -r, --root <dir>         Upload root (default: current directory)\n"
        << "  -s, --staging <dir>      Directory for partial uploads\n"
        << "                           (default: <temp>/bitsd-staging)\n"
        << "      --max-fragment <n>   Largest accepted fragment in bytes (default 104857600)\n"
        << "      --max-body <n>       Largest accepted request body in bytes\n"
        << "                           (default: twice the fragment limit)\n"
        << "      --idle-timeout <s>   Cancel sessions idle this long, 0 disables (default 0)\n"
        << "      --sweep-interval <s> Idle sweep period (default 30)\n"
        << "  -t, --threads <n>        Worker threads (default: hardware concurrency)\n"
        << "      --verify-retransmits Fail sessions whose retransmitted bytes differ\n"
        << "  -l, --log-level <lvl>    trace, debug, info, warn, err, critical, off\n"
        << "  -c, --config <file>      JSON config file; flags override its values\n"
        << "  -h, --help               Show this help\n";
    return oss.str();
}

} // namespace bitsd
