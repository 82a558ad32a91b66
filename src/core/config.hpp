#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.socprint/config.yaml
    static Result<Config> load_global();

    // Load from an explicit file
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by tests and by load_file)
    static Result<Config> load_string(const std::string& yaml);

    // Accessors
    const ConnectionConfig& connection() const { return connection_; }
    const std::vector<std::string>& queues() const { return queues_; }
    int poll_interval() const { return poll_interval_; }
    int connect_attempts() const { return connect_attempts_; }
    int retry_backoff_ms() const { return retry_backoff_ms_; }
    const std::string& staging_dir() const { return staging_dir_; }

    static Config build(const ConnectionConfig& conn, std::vector<std::string> queues,
                        int poll_interval, int attempts, int backoff_ms,
                        std::string staging_dir);

public:
    Config();

private:
    ConnectionConfig connection_;
    std::vector<std::string> queues_;
    int poll_interval_;
    int connect_attempts_;
    int retry_backoff_ms_;
    std::string staging_dir_;
};

// Parse "user@host:port" (user and port optional) onto an existing config.
Result<ConnectionConfig> parse_target(const std::string& spec, ConnectionConfig base);

// Helper to check if config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
