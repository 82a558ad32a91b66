#include "command_serializer.hpp"
#include "job_log.hpp"
#include <ssh/remote_session.hpp>
#include <fmt/format.h>

static Result<std::string> not_connected() {
    return Result<std::string>::Err(ErrorKind::NotConnected, "Not connected");
}

CommandSerializer::CommandSerializer() {
    worker_ = std::thread(&CommandSerializer::worker_loop, this);
}

CommandSerializer::~CommandSerializer() {
    std::deque<std::unique_ptr<Task>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        pending.swap(queue_);
        session_.reset();
    }
    cv_.notify_all();
    for (auto& t : pending) t->promise.set_value({not_connected(), 0});
    if (worker_.joinable()) worker_.join();
}

void CommandSerializer::attach(std::shared_ptr<RemoteSession> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = std::move(session);
    ++generation_;
}

void CommandSerializer::detach() {
    std::deque<std::unique_ptr<Task>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ && queue_.empty()) return;
        session_.reset();
        ++generation_;
        pending.swap(queue_);
    }
    if (!pending.empty()) {
        socprint_log(fmt::format("serializer: detach failed {} queued task(s)", pending.size()));
    }
    for (auto& t : pending) t->promise.set_value({not_connected(), 0});
}

bool CommandSerializer::attached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

uint64_t CommandSerializer::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seq_;
}

void CommandSerializer::set_session_lost_callback(SessionLostCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_session_lost_ = std::move(cb);
}

Result<std::string> CommandSerializer::execute(const std::string& command, uint64_t* seq,
                                               int timeout_secs) {
    auto task = std::make_unique<Task>();
    task->command = command;
    task->timeout_secs = timeout_secs;
    auto done = submit(std::move(task));
    if (seq) *seq = done.seq;
    return done.result;
}

Result<void> CommandSerializer::upload(const fs::path& local, const std::string& remote) {
    auto task = std::make_unique<Task>();
    task->is_upload = true;
    task->local = local;
    task->remote = remote;
    auto done = submit(std::move(task));
    if (done.result.is_err()) {
        return Result<void>::Err(done.result.kind, done.result.error);
    }
    return Result<void>::Ok();
}

CommandSerializer::TaskResult CommandSerializer::submit(std::unique_ptr<Task> task) {
    auto future = task->promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || stop_) {
            return {not_connected(), 0};
        }
        task->generation = generation_;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return future.get();
}

void CommandSerializer::worker_loop() {
    while (true) {
        std::unique_ptr<Task> task;
        std::shared_ptr<RemoteSession> session;
        uint64_t seq = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (stop_) return;
            task = std::move(queue_.front());
            queue_.pop_front();
            if (task->generation == generation_ && session_) {
                session = session_;
                seq = ++seq_;
            }
        }

        if (!session) {
            task->promise.set_value({not_connected(), 0});
            continue;
        }

        TaskResult outcome = run_task(*task, session, seq);
        bool lost = outcome.result.kind == ErrorKind::Connection && !session->is_active();
        std::string reason = outcome.result.error;
        task->promise.set_value(std::move(outcome));

        if (lost) {
            SessionLostCallback cb;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cb = on_session_lost_;
            }
            socprint_log("serializer: session lost: " + reason);
            if (cb) cb(session, reason);
        }
    }
}

CommandSerializer::TaskResult CommandSerializer::run_task(Task& task,
                                                          const std::shared_ptr<RemoteSession>& session,
                                                          uint64_t seq) {
    SSHResult r = task.is_upload ? session->upload(task.local, task.remote)
                                 : session->run(task.command, task.timeout_secs);

    if (r.exit_code < 0) {
        std::string msg = r.stderr_data.empty() ? "Remote session error" : r.stderr_data;
        return {Result<std::string>::Err(ErrorKind::Connection, msg), seq};
    }
    if (r.exit_code != 0) {
        std::string raw = r.get_output();
        if (raw.empty()) raw = fmt::format("exit status {}", r.exit_code);
        return {Result<std::string>::Err(ErrorKind::RemoteCommand, raw), seq};
    }
    return {Result<std::string>::Ok(r.stdout_data), seq};
}
