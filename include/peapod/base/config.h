#ifndef PEAPOD_BASE_CONFIG_H
#define PEAPOD_BASE_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace peapod {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stderr";  // stdout, stderr, file
    std::string file_path = "";
};

// Host-side node configuration. The core never binds these ports; they are
// advertised in beacons and used by the host transports.
struct NodeConfig {
    uint16_t proxy_port = 3128;
    uint16_t discovery_port = 45678;
    uint16_t transport_port = 45679;
    std::string identity_key_file;  // hex-encoded X25519 private key; empty = ephemeral
};

// Protocol engine configuration. All durations are in ticks.
struct CoreConfig {
    uint64_t chunk_size = 256 * 1024;
    uint32_t heartbeat_timeout_ticks = 3;
    uint32_t suspect_after_ticks = 2;
    uint32_t max_integrity_failures = 3;
    uint32_t transfer_idle_timeout_ticks = 60;
    bool allow_self_fetch = true;
    uint32_t tick_interval_ms = 1000;  // advisory: how often the host should call tick()
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    CoreConfig core;
};

// Options of the peapod command-line tool that are not part of the engine config
struct ToolOptions {
    uint32_t simulate_peers = 0;
    uint64_t simulate_size = 1024 * 1024;
    bool drop_peer = false;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI file ([log], [node], [core] sections)
    bool load_from_file(const std::string& path);

    // Load configuration from PEAPOD_* environment variables
    bool load_from_env();

    // Parse command line arguments and override config.
    // Returns false for --help/--version or parse errors.
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const ToolOptions& tool() const { return tool_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Reset to defaults (tests)
    void reset();

    // Check that timeouts and sizes are consistent
    bool validate() const;

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void apply_log_config();

    GlobalConfig config_;
    ToolOptions tool_;
    std::string config_file_;
};

} // namespace peapod

#endif // PEAPOD_BASE_CONFIG_H
