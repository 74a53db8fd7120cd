#include "peapod/base/config.h"
#include "peapod/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace peapod {

namespace {

using Sections = std::map<std::string, std::map<std::string, std::string>>;

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug") return elio::log::level::debug;
    if (level == "info") return elio::log::level::info;
    if (level == "warning") return elio::log::level::warning;
    if (level == "error") return elio::log::level::error;
    return elio::log::level::info;
}

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, Sections& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

template <typename T>
void assign_number(const std::string& key, const std::string& text, T& target) {
    try {
        size_t consumed = 0;
        unsigned long long parsed = std::stoull(text, &consumed);
        if (consumed != text.size() || parsed > std::numeric_limits<T>::max()) {
            throw std::out_of_range(text);
        }
        target = static_cast<T>(parsed);
    } catch (const std::exception&) {
        Logger::instance().warning("Ignoring invalid value for {}: '{}'", key, text);
    }
}

void assign_bool(const std::string& text, bool& target) {
    target = (text == "true" || text == "1" || text == "yes");
}

template <typename T>
void env_number(const char* name, T& target) {
    if (const char* val = std::getenv(name)) {
        assign_number(name, val, target);
    }
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    tool_ = ToolOptions{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    Sections sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to read config file: " + path);
        return false;
    }
    config_file_ = path;

    if (sections.count("log")) {
        auto& s = sections["log"];
        if (s.count("level")) config_.log.level = s["level"];
        if (s.count("output")) config_.log.output = s["output"];
        if (s.count("file_path")) config_.log.file_path = s["file_path"];
    }

    if (sections.count("node")) {
        auto& s = sections["node"];
        if (s.count("proxy_port")) assign_number("node.proxy_port", s["proxy_port"], config_.node.proxy_port);
        if (s.count("discovery_port")) assign_number("node.discovery_port", s["discovery_port"], config_.node.discovery_port);
        if (s.count("transport_port")) assign_number("node.transport_port", s["transport_port"], config_.node.transport_port);
        if (s.count("identity_key_file")) config_.node.identity_key_file = s["identity_key_file"];
    }

    if (sections.count("core")) {
        auto& s = sections["core"];
        auto& core = config_.core;
        if (s.count("chunk_size")) assign_number("core.chunk_size", s["chunk_size"], core.chunk_size);
        if (s.count("heartbeat_timeout_ticks")) {
            assign_number("core.heartbeat_timeout_ticks", s["heartbeat_timeout_ticks"], core.heartbeat_timeout_ticks);
        }
        if (s.count("suspect_after_ticks")) {
            assign_number("core.suspect_after_ticks", s["suspect_after_ticks"], core.suspect_after_ticks);
        }
        if (s.count("max_integrity_failures")) {
            assign_number("core.max_integrity_failures", s["max_integrity_failures"], core.max_integrity_failures);
        }
        if (s.count("transfer_idle_timeout_ticks")) {
            assign_number("core.transfer_idle_timeout_ticks", s["transfer_idle_timeout_ticks"],
                          core.transfer_idle_timeout_ticks);
        }
        if (s.count("allow_self_fetch")) assign_bool(s["allow_self_fetch"], core.allow_self_fetch);
        if (s.count("tick_interval_ms")) assign_number("core.tick_interval_ms", s["tick_interval_ms"], core.tick_interval_ms);
    }

    apply_log_config();
    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    if (const char* val = std::getenv("PEAPOD_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("PEAPOD_LOG_OUTPUT")) {
        config_.log.output = val;
    }
    if (const char* val = std::getenv("PEAPOD_LOG_FILE")) {
        config_.log.file_path = val;
    }
    if (const char* val = std::getenv("PEAPOD_IDENTITY_KEY_FILE")) {
        config_.node.identity_key_file = val;
    }

    env_number("PEAPOD_PROXY_PORT", config_.node.proxy_port);
    env_number("PEAPOD_DISCOVERY_PORT", config_.node.discovery_port);
    env_number("PEAPOD_TRANSPORT_PORT", config_.node.transport_port);
    env_number("PEAPOD_CHUNK_SIZE", config_.core.chunk_size);
    env_number("PEAPOD_HEARTBEAT_TIMEOUT_TICKS", config_.core.heartbeat_timeout_ticks);
    env_number("PEAPOD_MAX_INTEGRITY_FAILURES", config_.core.max_integrity_failures);

    apply_log_config();
    return true;
}

bool Config::parse_command_line(int argc, char* argv[]) {
    // The file is loaded before parsing so that explicit flags override it.
    // The environment is applied again on top of the file.
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (load_from_file(argv[i + 1])) {
                load_from_env();
            }
            break;
        }
    }

    CLI::App app{"PeaPod - local peer-assisted download acceleration core"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Node options
    app.add_option("--proxy-port", config_.node.proxy_port, "Local proxy port advertised to the host");
    app.add_option("--discovery-port", config_.node.discovery_port, "LAN discovery UDP port");
    app.add_option("--transport-port", config_.node.transport_port, "Local transport TCP port");
    app.add_option("--identity-key-file", config_.node.identity_key_file, "Hex-encoded X25519 private key");

    // Core options
    app.add_option("--chunk-size", config_.core.chunk_size, "Chunk size in bytes");
    app.add_option("--heartbeat-timeout", config_.core.heartbeat_timeout_ticks, "Ticks of silence before a peer is dropped");
    app.add_option("--suspect-after", config_.core.suspect_after_ticks, "Ticks of silence before a peer is suspect");
    app.add_option("--max-integrity-failures", config_.core.max_integrity_failures,
                   "Consecutive integrity failures before a peer is isolated");
    app.add_option("--transfer-idle-timeout", config_.core.transfer_idle_timeout_ticks,
                   "Ticks without progress before a transfer is abandoned");
    app.add_option("--allow-self-fetch", config_.core.allow_self_fetch, "Whether this device fetches chunks itself");
    app.add_option("--tick-interval", config_.core.tick_interval_ms, "Host tick interval (ms)");

    // Tool options
    app.add_option("--simulate", tool_.simulate_peers, "Run an in-memory pod with N peers");
    app.add_option("--size", tool_.simulate_size, "Body size for the simulated transfer (bytes)");
    app.add_flag("--drop-peer", tool_.drop_peer, "Drop one peer mid-transfer during simulation");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version exit with code 0 after printing
        app.exit(e);
        return false;
    }

    apply_log_config();
    return true;
}

void Config::apply_log_config() {
    auto& logger = Logger::instance();
    if (!config_.log.level.empty()) {
        logger.set_level(parse_log_level(config_.log.level));
    }
    LogOutput output = parse_log_output(config_.log.output);
    if (output == LogOutput::File) {
        if (config_.log.file_path.empty()) {
            logger.warning("log.output is file but log.file_path is empty; logging to stderr");
            logger.set_output(LogOutput::Stderr);
        } else {
            logger.set_file_output(config_.log.file_path);
        }
        return;
    }
    logger.close_file_output();
    logger.set_output(output);
}

bool Config::validate() const {
    const auto& core = config_.core;
    if (core.chunk_size == 0) {
        Logger::instance().error("core.chunk_size must be positive");
        return false;
    }
    if (core.heartbeat_timeout_ticks == 0) {
        Logger::instance().error("core.heartbeat_timeout_ticks must be positive");
        return false;
    }
    if (core.suspect_after_ticks == 0 || core.suspect_after_ticks >= core.heartbeat_timeout_ticks) {
        Logger::instance().error("core.suspect_after_ticks must be in [1, heartbeat_timeout_ticks)");
        return false;
    }
    if (core.max_integrity_failures == 0) {
        Logger::instance().error("core.max_integrity_failures must be positive");
        return false;
    }
    if (core.transfer_idle_timeout_ticks == 0) {
        Logger::instance().error("core.transfer_idle_timeout_ticks must be positive");
        return false;
    }
    return true;
}

void Config::print() const {
    auto& log = Logger::instance();
    log.info("=== Configuration ===");
    log.info("Log Level: " + config_.log.level);
    log.info("Discovery Port: {}", config_.node.discovery_port);
    log.info("Transport Port: {}", config_.node.transport_port);
    log.info("Chunk Size: {} bytes", config_.core.chunk_size);
    log.info("Heartbeat Timeout: {} ticks (suspect after {})",
             config_.core.heartbeat_timeout_ticks, config_.core.suspect_after_ticks);
    log.info("Isolation Threshold: {} failures", config_.core.max_integrity_failures);
    log.info("Self Fetch: {}", config_.core.allow_self_fetch ? "enabled" : "disabled");
}

} // namespace peapod
