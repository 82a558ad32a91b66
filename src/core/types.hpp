#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Error categories carried by Result. Callers branch on these, the message
// is for humans.
enum class ErrorKind {
    None,
    Connection,         // auth failure, unreachable host, handshake timeout
    AlreadyConnecting,  // a connect attempt is already in flight
    NotConnected,       // remote operation attempted without a live session
    RemoteCommand,      // command ran but reported failure (raw output attached)
    Staging,            // file could not be made available to the remote side
    InvalidTransition,  // illegal job state change
    NotFound,
    Config,
    Storage,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Connection configuration
enum class AuthMethod {
    Password,
    PrivateKey,
};

struct ConnectionConfig {
    std::string host;
    int port = 22;
    std::string user;
    AuthMethod auth = AuthMethod::Password;
    std::string key_path;       // only for AuthMethod::PrivateKey
    int timeout = 30;

    // Password, or key passphrase. Never serialized with the config.
    std::string secret;

    std::string target() const { return user + "@" + host; }
};

const char* auth_method_name(AuthMethod method);
std::optional<AuthMethod> parse_auth_method(const std::string& name);

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
