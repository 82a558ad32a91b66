#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_session.hpp>

class CommandSerializer;

struct Disconnected {};
struct Connecting {
    int elapsed_seconds = 0;
};
struct Connected {
    std::string connected_at;       // ISO timestamp
};
struct Failed {
    std::string message;
    std::string last_attempt_at;    // ISO timestamp
};

using ConnectionStatus = std::variant<Disconnected, Connecting, Connected, Failed>;

const char* status_name(const ConnectionStatus& status);    // "disconnected", ...

struct RetryPolicy {
    int attempts = 3;
    int backoff_ms = 1000;          // first delay, doubled per retry
    int tick_ms = 1000;             // Connecting{elapsed} update period
};

// Owns the one RemoteSession and the connection state machine. Status
// changes only happen here; everything else observes them.
class SessionLifecycle {
public:
    using StatusListener = std::function<void(const ConnectionStatus&)>;

    SessionLifecycle(CommandSerializer& serializer, SessionOpener opener,
                     RetryPolicy policy = RetryPolicy{});
    ~SessionLifecycle();

    SessionLifecycle(const SessionLifecycle&) = delete;
    SessionLifecycle& operator=(const SessionLifecycle&) = delete;

    // Blocks until Connected or Failed. Rejected with AlreadyConnecting
    // while another attempt is running. A live session is torn down first.
    // An attempt aborted by disconnect() still counts as running until its
    // opener call returns, even though status() already says Disconnected.
    Result<void> connect(const ConnectionConfig& config, StatusCallback progress = nullptr);

    // Idempotent. Aborts an attempt in progress (it resolves to
    // Disconnected once the pending opener call returns) or closes the
    // live session.
    Result<void> disconnect();

    ConnectionStatus status() const;
    bool is_connected() const;

    // Listeners run on whichever thread changed the status, one at a time,
    // and always receive the status current at delivery.
    void add_status_listener(StatusListener listener);

private:
    CommandSerializer& serializer_;
    SessionOpener opener_;
    RetryPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable abort_cv_;
    ConnectionStatus status_;
    std::shared_ptr<RemoteSession> session_;
    bool connecting_ = false;
    bool abort_ = false;

    std::mutex ticker_mutex_;
    std::condition_variable ticker_cv_;
    bool ticker_stop_ = false;
    std::thread ticker_;

    std::mutex listener_mutex_;
    std::mutex publish_mutex_;
    std::vector<StatusListener> listeners_;

    void publish();
    void start_ticker();
    void stop_ticker();
    void on_session_lost(const std::shared_ptr<RemoteSession>& session, const std::string& reason);
};
