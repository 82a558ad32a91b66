#include "session_lifecycle.hpp"
#include "command_serializer.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

const char* status_name(const ConnectionStatus& status) {
    struct Visitor {
        const char* operator()(const Disconnected&) const { return "disconnected"; }
        const char* operator()(const Connecting&) const { return "connecting"; }
        const char* operator()(const Connected&) const { return "connected"; }
        const char* operator()(const Failed&) const { return "failed"; }
    };
    return std::visit(Visitor{}, status);
}

SessionLifecycle::SessionLifecycle(CommandSerializer& serializer, SessionOpener opener,
                                   RetryPolicy policy)
    : serializer_(serializer), opener_(std::move(opener)), policy_(policy),
      status_(Disconnected{}) {
    if (policy_.attempts < 1) policy_.attempts = 1;
    serializer_.set_session_lost_callback(
        [this](const std::shared_ptr<RemoteSession>& s, const std::string& reason) {
            on_session_lost(s, reason);
        });
}

SessionLifecycle::~SessionLifecycle() {
    serializer_.set_session_lost_callback(nullptr);
    stop_ticker();
    std::shared_ptr<RemoteSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abort_ = true;
        session.swap(session_);
    }
    abort_cv_.notify_all();
    serializer_.detach();
    if (session) session->close();
}

ConnectionStatus SessionLifecycle::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool SessionLifecycle::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::holds_alternative<Connected>(status_) && session_ != nullptr;
}

void SessionLifecycle::add_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}

void SessionLifecycle::publish() {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    ConnectionStatus current = status();
    std::vector<StatusListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = listeners_;
    }
    for (auto& l : listeners) l(current);
}

Result<void> SessionLifecycle::connect(const ConnectionConfig& config, StatusCallback progress) {
    std::shared_ptr<RemoteSession> old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connecting_) {
            return Result<void>::Err(ErrorKind::AlreadyConnecting, "Already connecting");
        }
        connecting_ = true;
        abort_ = false;
        old.swap(session_);
        status_ = Connecting{0};
    }

    if (old) {
        socprint_log("lifecycle: replacing session " + old->describe());
        serializer_.detach();
        old->close();
        old.reset();
    }
    publish();
    start_ticker();

    socprint_log(fmt::format("lifecycle: connecting to {}:{}", config.target(), config.port));

    Result<std::shared_ptr<RemoteSession>> opened =
        Result<std::shared_ptr<RemoteSession>>::Err(ErrorKind::Connection, "Connection aborted");
    for (int attempt = 1; attempt <= policy_.attempts; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (abort_) break;
        }

        opened = opener_(config, progress);
        if (opened.is_ok()) break;
        socprint_log(fmt::format("lifecycle: attempt {}/{} failed: {}",
                                 attempt, policy_.attempts, opened.error));

        if (attempt < policy_.attempts) {
            int delay = policy_.backoff_ms << (attempt - 1);
            if (progress) {
                progress(fmt::format("{} (retrying in {}ms)", opened.error, delay));
            }
            std::unique_lock<std::mutex> lock(mutex_);
            abort_cv_.wait_for(lock, std::chrono::milliseconds(delay), [this] { return abort_; });
        }
    }

    stop_ticker();

    std::shared_ptr<RemoteSession> orphan;
    Result<void> result = Result<void>::Ok();
    bool aborted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_ = false;
        if (abort_) {
            aborted = true;
            // disconnect() already published Disconnected
            if (opened.is_ok()) orphan = opened.value;
            result = Result<void>::Err(ErrorKind::Connection, "Connection attempt aborted");
        } else if (opened.is_ok()) {
            session_ = opened.value;
            serializer_.attach(session_);
            status_ = Connected{now_iso()};
        } else {
            status_ = Failed{opened.error, now_iso()};
            result = Result<void>::Err(ErrorKind::Connection, opened.error);
        }
    }

    if (orphan) orphan->close();
    if (result.is_ok()) {
        socprint_log("lifecycle: connected to " + config.target());
    }
    if (!aborted) publish();
    return result;
}

Result<void> SessionLifecycle::disconnect() {
    std::shared_ptr<RemoteSession> session;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connecting_) {
            abort_ = true;
        }
        session.swap(session_);
        changed = !std::holds_alternative<Disconnected>(status_);
        status_ = Disconnected{};
    }
    abort_cv_.notify_all();

    serializer_.detach();
    if (session) {
        socprint_log("lifecycle: disconnecting " + session->describe());
        session->close();
    }
    if (changed) publish();
    return Result<void>::Ok();
}

void SessionLifecycle::on_session_lost(const std::shared_ptr<RemoteSession>& lost,
                                       const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_ != lost) return;
        session_.reset();
        status_ = Failed{"Connection lost: " + reason, now_iso()};
    }
    serializer_.detach();
    lost->close();
    publish();
}

void SessionLifecycle::start_ticker() {
    stop_ticker();
    {
        std::lock_guard<std::mutex> lock(ticker_mutex_);
        ticker_stop_ = false;
    }
    ticker_ = std::thread([this] {
        auto started = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(ticker_mutex_);
        while (!ticker_cv_.wait_for(lock, std::chrono::milliseconds(policy_.tick_ms),
                                    [this] { return ticker_stop_; })) {
            int elapsed = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - started).count());
            bool bumped = false;
            {
                std::lock_guard<std::mutex> state_lock(mutex_);
                if (auto* c = std::get_if<Connecting>(&status_)) {
                    c->elapsed_seconds = std::max(c->elapsed_seconds + 1, elapsed);
                    bumped = true;
                }
            }
            if (bumped) {
                lock.unlock();
                publish();
                lock.lock();
            }
        }
    });
}

void SessionLifecycle::stop_ticker() {
    {
        std::lock_guard<std::mutex> lock(ticker_mutex_);
        ticker_stop_ = true;
    }
    ticker_cv_.notify_all();
    if (ticker_.joinable()) ticker_.join();
}
