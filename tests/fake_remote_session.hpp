#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <ssh/remote_session.hpp>

// Scripted RemoteSession. Commands are answered by the first rule whose
// prefix matches; unmatched commands succeed with empty output. Every
// command and upload is recorded in arrival order.
class FakeRemoteSession : public RemoteSession {
public:
    using Handler = std::function<SSHResult(const std::string& command)>;

    void on(const std::string& prefix, int exit_code, const std::string& output) {
        on(prefix, [exit_code, output](const std::string&) {
            return SSHResult{exit_code, output, ""};
        });
    }

    void on(const std::string& prefix, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_.push_back({prefix, std::move(handler)});
    }

    // Transport failure on the next matching command; the session goes dead.
    void drop_on(const std::string& prefix) {
        on(prefix, [this](const std::string&) {
            active_ = false;
            return SSHResult{-1, "", "Channel closed"};
        });
    }

    void fail_uploads(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_error_ = reason;
    }

    // Commands with this prefix wait until release() is called.
    void hold(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        held_prefix_ = prefix;
        released_ = false;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    // Block until a held command has arrived.
    bool wait_until_held(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return holding_; });
    }

    SSHResult run(const std::string& command, int) override {
        Handler handler;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            commands_.push_back(command);
            if (!held_prefix_.empty() && command.rfind(held_prefix_, 0) == 0) {
                holding_ = true;
                cv_.notify_all();
                cv_.wait(lock, [this] { return released_; });
                holding_ = false;
            }
            for (const auto& r : rules_) {
                if (command.rfind(r.prefix, 0) == 0) {
                    handler = r.handler;
                    break;
                }
            }
        }
        if (!active_) return SSHResult{-1, "", "Session closed"};
        if (!handler) return SSHResult{0, "", ""};
        return handler(command);
    }

    SSHResult upload(const fs::path& local, const std::string& remote) override {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_.push_back(remote);
        commands_.push_back("upload " + remote);
        if (!active_) return SSHResult{-1, "", "Session closed"};
        if (!upload_error_.empty()) return SSHResult{1, "", upload_error_};
        return SSHResult{0, "", ""};
    }

    bool is_active() const override { return active_; }
    void close() override {
        active_ = false;
        closed_ = true;
        release();
    }
    std::string describe() const override { return "fake@printhost"; }

    std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    std::vector<std::string> uploads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_;
    }

    int count_prefix(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& c : commands_) {
            if (c.rfind(prefix, 0) == 0) n++;
        }
        return n;
    }

    bool closed() const { return closed_; }

private:
    struct Rule {
        std::string prefix;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Rule> rules_;
    std::vector<std::string> commands_;
    std::vector<std::string> uploads_;
    std::string upload_error_;
    std::string held_prefix_;
    bool released_ = true;
    bool holding_ = false;
    std::atomic<bool> active_{true};
    std::atomic<bool> closed_{false};
};

// SessionOpener that hands out pre-built sessions, or fails a set number
// of times first.
struct FakeOpener {
    std::shared_ptr<FakeRemoteSession> session = std::make_shared<FakeRemoteSession>();
    int failures_before_success = 0;
    std::string failure_message = "Authentication failed";
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};

    SessionOpener opener() {
        return [this](const ConnectionConfig&, StatusCallback cb) {
            int n = ++calls;
            if (delay.count() > 0) std::this_thread::sleep_for(delay);
            if (n <= failures_before_success) {
                return Result<std::shared_ptr<RemoteSession>>::Err(ErrorKind::Connection,
                                                                   failure_message);
            }
            if (cb) cb("fake session ready");
            return Result<std::shared_ptr<RemoteSession>>::Ok(session);
        };
    }
};

// Waits for a condition set by another thread.
inline bool eventually(const std::function<bool()>& cond,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}
