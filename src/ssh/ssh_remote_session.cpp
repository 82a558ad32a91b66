#include "ssh_remote_session.hpp"
#include "connection.hpp"
#include "session.hpp"
#include <managers/job_log.hpp>
#include <mutex>

namespace {

class SshRemoteSession : public RemoteSession {
public:
    explicit SshRemoteSession(std::unique_ptr<SessionManager> session)
        : session_(std::move(session)),
          conn_(session_->get_channel(), session_->get_raw_session(), session_->io_mutex()) {}

    ~SshRemoteSession() override { close(); }

    SSHResult run(const std::string& command, int timeout_secs) override {
        std::lock_guard<std::mutex> lock(op_mutex_);
        if (!is_active()) return SSHResult{-1, "", "Session closed"};
        if (!session_->check_alive()) return SSHResult{-1, "", "Connection lost"};
        return conn_.run(command, timeout_secs);
    }

    SSHResult upload(const fs::path& local, const std::string& remote) override {
        std::lock_guard<std::mutex> lock(op_mutex_);
        if (!is_active()) return SSHResult{-1, "", "Session closed"};
        return conn_.upload(local, remote);
    }

    bool is_active() const override {
        return session_->is_active() && conn_.is_active();
    }

    // Interrupts a running command, waits for it to return, then frees
    // the libssh2 handles.
    void close() override {
        conn_.interrupt();
        std::lock_guard<std::mutex> lock(op_mutex_);
        if (session_->is_active()) {
            socprint_log("Closing session " + session_->get_target());
        }
        session_->close();
    }

    std::string describe() const override { return session_->get_target(); }

private:
    std::unique_ptr<SessionManager> session_;
    SSHConnection conn_;
    std::mutex op_mutex_;
};

} // namespace

Result<std::shared_ptr<RemoteSession>> open_ssh_session(const ConnectionConfig& config,
                                                        StatusCallback callback) {
    auto session = std::make_unique<SessionManager>(config);
    auto result = session->establish(callback);
    if (result.failed()) {
        return Result<std::shared_ptr<RemoteSession>>::Err(
            ErrorKind::Connection,
            result.stderr_data.empty() ? "Connection failed" : result.stderr_data);
    }
    std::shared_ptr<RemoteSession> remote = std::make_shared<SshRemoteSession>(std::move(session));
    return Result<std::shared_ptr<RemoteSession>>::Ok(remote);
}
