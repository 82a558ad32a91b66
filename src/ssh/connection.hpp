#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <core/types.hpp>

namespace fs = std::filesystem;

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Command execution over an established session: marker-framed commands on
// the PTY shell channel, binary input on short-lived exec channels.
class SSHConnection {
public:
    SSHConnection(LIBSSH2_CHANNEL* channel, LIBSSH2_SESSION* session,
                  std::shared_ptr<std::mutex> io_mutex);

    SSHResult run(const std::string& command, int timeout_secs = 0);
    SSHResult upload(const fs::path& local, const std::string& remote);

    // Execute a command on a new exec channel and pipe binary data to its stdin.
    SSHResult run_with_input(const std::string& command,
                             const char* data, size_t data_len,
                             int timeout_secs = 0);

    // False after a channel read/write error, remote EOF or interrupt().
    bool is_active() const;

    // Makes a running command return early; the connection stays unusable.
    void interrupt() { broken_ = true; }

private:
    LIBSSH2_CHANNEL* channel_;
    LIBSSH2_SESSION* session_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::atomic<bool> broken_{false};

    LIBSSH2_CHANNEL* open_exec_channel(const std::string& command, std::string& error);
    void free_channel(LIBSSH2_CHANNEL* ch);
};
