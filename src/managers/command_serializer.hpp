#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/types.hpp>

namespace fs = std::filesystem;

class RemoteSession;

// Single worker, FIFO. Every remote command and upload in the process goes
// through here so the shell only ever sees one request at a time.
//
// A hung command blocks everything queued behind it until the channel's own
// timeout fires; there is no escalation here.
class CommandSerializer {
public:
    // Fired on the worker thread, after the failing task's caller has been
    // released, when a transport error leaves the session inactive.
    using SessionLostCallback =
        std::function<void(const std::shared_ptr<RemoteSession>& session, const std::string& reason)>;

    CommandSerializer();
    ~CommandSerializer();

    CommandSerializer(const CommandSerializer&) = delete;
    CommandSerializer& operator=(const CommandSerializer&) = delete;

    void attach(std::shared_ptr<RemoteSession> session);

    // Fails every queued task with NotConnected. A task already running
    // keeps its own reference and finishes against it.
    void detach();

    bool attached() const;

    // Output on exit status 0. NotConnected immediately when nothing is
    // attached; RemoteCommand with the raw output on a non-zero exit;
    // Connection on a transport failure. `seq`, when given, receives the
    // execution sequence number of this command (0 if it never ran).
    Result<std::string> execute(const std::string& command, uint64_t* seq = nullptr,
                                int timeout_secs = 0);

    Result<void> upload(const fs::path& local, const std::string& remote);

    void set_session_lost_callback(SessionLostCallback cb);

    // Sequence number of the most recently started task.
    uint64_t last_seq() const;

private:
    struct TaskResult {
        Result<std::string> result;
        uint64_t seq;
    };

    struct Task {
        bool is_upload = false;
        std::string command;
        fs::path local;
        std::string remote;
        int timeout_secs = 0;
        uint64_t generation = 0;
        std::promise<TaskResult> promise;
    };

    TaskResult submit(std::unique_ptr<Task> task);
    void worker_loop();
    TaskResult run_task(Task& task, const std::shared_ptr<RemoteSession>& session, uint64_t seq);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Task>> queue_;
    std::shared_ptr<RemoteSession> session_;
    uint64_t generation_ = 0;
    uint64_t seq_ = 0;
    bool stop_ = false;
    SessionLostCallback on_session_lost_;
    std::thread worker_;
};
