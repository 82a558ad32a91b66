#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

static const std::vector<std::string> DEFAULT_QUEUES{"psts", "psc008", "pstsc"};

Config::Config()
    : queues_(DEFAULT_QUEUES),
      poll_interval_(POLL_INTERVAL_SECS),
      connect_attempts_(SSH_CONNECT_ATTEMPTS),
      retry_backoff_ms_(SSH_RETRY_BACKOFF_MS),
      staging_dir_(DEFAULT_STAGING_DIR) {
    connection_.host = DEFAULT_HOST;
    connection_.port = DEFAULT_PORT;
    connection_.timeout = SSH_CONNECT_TIMEOUT_SECS;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::app_dir();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config,
                                 "Failed to create " + config_path.parent_path().string());
    }

    const char* default_config = R"(# socprint configuration

connection:
  host: "stu.comp.nus.edu.sg"
  port: 22
  user: ""                         # Password is kept in ~/.socprint/credentials
  auth: "password"                 # "password" or "key"
  key_path: ""                     # e.g. ~/.ssh/id_ed25519 when auth is "key"
  timeout: 30

# Print queues polled with lpq
queues: ["psts", "psc008", "pstsc"]

# Seconds between queue polls
poll_interval: 30

# Connection attempts before giving up, and the first retry delay
connect_attempts: 3
retry_backoff_ms: 1000

# Remote directory files are staged into before lpr
staging_dir: "/tmp"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Config,
                                 "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static std::string expand_home(const std::string& path) {
    if (path.size() >= 1 && path[0] == '~') {
        return (platform::home_dir() / path.substr(path.size() > 1 && path[1] == '/' ? 2 : 1)).string();
    }
    return path;
}

static Result<Config> parse_config(const YAML::Node& root) {
    Config config;
    ConnectionConfig conn = config.connection();
    std::vector<std::string> queues = config.queues();
    int poll_interval = config.poll_interval();
    int attempts = config.connect_attempts();
    int backoff = config.retry_backoff_ms();
    std::string staging = config.staging_dir();

    if (root["connection"]) {
        const auto& node = root["connection"];
        conn.host = node["host"].as<std::string>(conn.host);
        conn.port = node["port"].as<int>(conn.port);
        conn.user = node["user"].as<std::string>("");
        conn.timeout = node["timeout"].as<int>(conn.timeout);
        conn.key_path = expand_home(node["key_path"].as<std::string>(""));

        std::string auth = node["auth"].as<std::string>("password");
        auto method = parse_auth_method(auth);
        if (!method) {
            return Result<Config>::Err(ErrorKind::Config, "Unknown auth method: " + auth);
        }
        conn.auth = *method;
    }

    if (conn.host.empty()) {
        return Result<Config>::Err(ErrorKind::Config, "connection.host is empty");
    }
    if (conn.port <= 0 || conn.port > 65535) {
        return Result<Config>::Err(ErrorKind::Config,
                                   fmt::format("connection.port out of range: {}", conn.port));
    }
    if (conn.auth == AuthMethod::PrivateKey && conn.key_path.empty()) {
        return Result<Config>::Err(ErrorKind::Config, "connection.key_path required for key auth");
    }

    if (root["queues"]) {
        queues.clear();
        const auto& q = root["queues"];
        if (q.IsSequence()) {
            for (const auto& item : q) {
                auto name = item.as<std::string>("");
                trim(name);
                if (!name.empty()) queues.push_back(name);
            }
        } else if (q.IsScalar()) {
            queues.push_back(q.as<std::string>());
        }
        if (queues.empty()) {
            return Result<Config>::Err(ErrorKind::Config, "queues is empty");
        }
    }

    poll_interval = root["poll_interval"].as<int>(poll_interval);
    attempts = root["connect_attempts"].as<int>(attempts);
    backoff = root["retry_backoff_ms"].as<int>(backoff);
    staging = root["staging_dir"].as<std::string>(staging);

    if (poll_interval <= 0) {
        return Result<Config>::Err(ErrorKind::Config, "poll_interval must be positive");
    }
    if (attempts <= 0) {
        return Result<Config>::Err(ErrorKind::Config, "connect_attempts must be positive");
    }
    if (backoff < 0) backoff = 0;
    while (staging.size() > 1 && staging.back() == '/') staging.pop_back();

    return Result<Config>::Ok(Config::build(conn, queues, poll_interval, attempts, backoff, staging));
}

Config Config::build(const ConnectionConfig& conn, std::vector<std::string> queues,
                     int poll_interval, int attempts, int backoff_ms,
                     std::string staging_dir) {
    Config c;
    c.connection_ = conn;
    c.queues_ = std::move(queues);
    c.poll_interval_ = poll_interval;
    c.connect_attempts_ = attempts;
    c.retry_backoff_ms_ = backoff_ms;
    c.staging_dir_ = std::move(staging_dir);
    return c;
}

Result<Config> Config::load_string(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(Config());
        }
        return parse_config(root);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config, std::string("Invalid config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::Config, "Config not found: " + path.string());
    }
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(Config());
        }
        return parse_config(root);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config,
                                   fmt::format("Invalid config {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        auto created = create_default_global_config();
        if (created.is_err()) {
            return Result<Config>::Err(created.kind, created.error);
        }
    }
    return load_file(get_global_config_path());
}

Result<ConnectionConfig> parse_target(const std::string& spec, ConnectionConfig base) {
    std::string rest = spec;
    trim(rest);
    if (rest.empty()) {
        return Result<ConnectionConfig>::Err(ErrorKind::Config, "Empty connection target");
    }

    auto at = rest.find('@');
    if (at != std::string::npos) {
        base.user = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        int port = safe_stoi(rest.substr(colon + 1), -1);
        if (port <= 0 || port > 65535) {
            return Result<ConnectionConfig>::Err(ErrorKind::Config,
                                                 "Invalid port in target: " + spec);
        }
        base.port = port;
        rest = rest.substr(0, colon);
    }

    if (rest.empty() || base.user.empty()) {
        return Result<ConnectionConfig>::Err(ErrorKind::Config,
                                             "Target must name a user and host: " + spec);
    }
    base.host = rest;
    return Result<ConnectionConfig>::Ok(base);
}
