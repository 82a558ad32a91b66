#include "connection.hpp"
#include "marker_protocol.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/job_log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <fstream>
#include <chrono>
#include <thread>

SSHConnection::SSHConnection(LIBSSH2_CHANNEL* channel, LIBSSH2_SESSION* session,
                             std::shared_ptr<std::mutex> io_mutex)
    : channel_(channel), session_(session), io_mutex_(std::move(io_mutex)) {
}

bool SSHConnection::is_active() const {
    return channel_ != nullptr && !broken_;
}

SSHResult SSHConnection::run(const std::string& command, int timeout_secs) {
    if (!is_active()) {
        return SSHResult{-1, "", "No channel available"};
    }

    // Drain stale output (late tail of a timed-out command)
    char drain[SSH_DRAIN_BUF_SIZE];
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        while (libssh2_channel_read(channel_, drain, sizeof(drain)) > 0) {}
    }

    std::string token = next_marker_token();
    std::string full_cmd = build_marker_command(command, token);

    size_t total = full_cmd.length();
    size_t sent = 0;
    int write_retries = 0;
    while (sent < total) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(channel_, full_cmd.c_str() + sent, total - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 500) {
                return SSHResult{-1, "", "Write stalled (EAGAIN for too long)"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (w < 0) {
            broken_ = true;
            return SSHResult{-1, "", "Failed to send command (channel write error)"};
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }

    std::string output;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (std::chrono::steady_clock::now() < deadline) {
        if (broken_) {
            return SSHResult{-1, output, "Session closed"};
        }
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(channel_, buf, sizeof(buf));
            if (n == 0) eof = libssh2_channel_eof(channel_) != 0;
        }
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            auto parsed = parse_marker_output(output, token);
            if (parsed.found) {
                socprint_log_ssh(command, parsed.exit_code, parsed.output);
                return SSHResult{parsed.exit_code, parsed.output, ""};
            }
        } else if (n == LIBSSH2_ERROR_EAGAIN || (n == 0 && !eof)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        } else {
            broken_ = true;
            return SSHResult{-1, output, eof ? "Remote shell closed" : "SSH channel read error"};
        }
    }

    // The shell may still be running it; the token keeps its DONE line
    // from matching the next command.
    socprint_log_ssh(command, -1, output);
    return SSHResult{-1, output, "Command timed out after " + std::to_string(effective_timeout) + "s"};
}

SSHResult SSHConnection::upload(const fs::path& local, const std::string& remote) {
    std::ifstream file(local, std::ios::binary);
    if (!file) {
        return SSHResult{-1, "", "Cannot read file: " + local.string()};
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    // Exec channel has no PTY, so the bytes arrive unmangled
    auto result = run_with_input("cat > " + shell_quote(remote), content.data(),
                                 content.size(), SSH_UPLOAD_TIMEOUT_SECS);
    socprint_log(fmt::format("upload {} -> {} ({} bytes) exit={}",
                             local.string(), remote, content.size(), result.exit_code));
    return result;
}

LIBSSH2_CHANNEL* SSHConnection::open_exec_channel(const std::string& command, std::string& error) {
    LIBSSH2_CHANNEL* exec_ch = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < open_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            exec_ch = libssh2_channel_open_session(session_);
            if (!exec_ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                error = "Failed to open exec channel";
                return nullptr;
            }
        }
        if (exec_ch) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!exec_ch) {
        error = "Timed out opening exec channel";
        return nullptr;
    }

    int rc = LIBSSH2_ERROR_EAGAIN;
    auto exec_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < exec_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(exec_ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (rc != 0) {
        free_channel(exec_ch);
        error = "Failed to exec command on channel";
        return nullptr;
    }
    return exec_ch;
}

void SSHConnection::free_channel(LIBSSH2_CHANNEL* ch) {
    int rc;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_close(ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN &&
             (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_free(ch);
}

SSHResult SSHConnection::run_with_input(const std::string& command,
                                        const char* data, size_t data_len,
                                        int timeout_secs) {
    if (!session_ || broken_) {
        return SSHResult{-1, "", "No session available"};
    }

    std::string error;
    LIBSSH2_CHANNEL* exec_ch = open_exec_channel(command, error);
    if (!exec_ch) {
        return SSHResult{-1, "", error};
    }

    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    size_t sent = 0;
    while (sent < data_len) {
        if (broken_) {
            free_channel(exec_ch);
            return SSHResult{-1, "", "Session closed"};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            free_channel(exec_ch);
            return SSHResult{-1, "", "Upload timed out"};
        }
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(exec_ch, data + sent, data_len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (w < 0) {
            free_channel(exec_ch);
            return SSHResult{-1, "", "Channel write error sending data"};
        }
        sent += static_cast<size_t>(w);
    }

    // EOF on stdin so the remote command finishes
    {
        int eof_rc;
        do {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            eof_rc = libssh2_channel_send_eof(exec_ch);
        } while (eof_rc == LIBSSH2_ERROR_EAGAIN &&
                 (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
    }

    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    bool finished = false;

    while (std::chrono::steady_clock::now() < deadline && !broken_) {
        ssize_t n;
        ssize_t e;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(exec_ch, buf, sizeof(buf));
            if (n > 0) output.append(buf, static_cast<size_t>(n));
            e = libssh2_channel_read_stderr(exec_ch, buf, sizeof(buf));
            if (e > 0) stderr_data.append(buf, static_cast<size_t>(e));
            eof = libssh2_channel_eof(exec_ch) != 0;
        }
        if (n > 0 || e > 0) continue;
        if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || (e < 0 && e != LIBSSH2_ERROR_EAGAIN)) {
            break;
        }
        if (eof) {
            finished = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    int exit_status = -1;
    int rc;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_close(exec_ch);
    } while (rc == LIBSSH2_ERROR_EAGAIN &&
             (std::this_thread::sleep_for(std::chrono::milliseconds(10)), true));
    if (rc == 0 && finished) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_status = libssh2_channel_get_exit_status(exec_ch);
    }
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(exec_ch);
    }

    if (!finished) {
        return SSHResult{-1, output, stderr_data.empty() ? "Exec channel did not finish" : stderr_data};
    }
    return SSHResult{exit_status, output, stderr_data};
}
