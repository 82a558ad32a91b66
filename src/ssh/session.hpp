#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Owns the TCP socket, the libssh2 session and the interactive shell channel
// of one login. Not reusable: a new SessionManager per connect.
class SessionManager {
public:
    explicit SessionManager(const ConnectionConfig& config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;
    // Keepalive probe plus socket and channel EOF check.
    bool check_alive();

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    LIBSSH2_CHANNEL* get_channel() { return channel_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    ConnectionConfig config_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult establish_connection(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    SSHResult open_shell(StatusCallback callback);
    SSHResult fail(const std::string& reason, const std::string& message);
};
