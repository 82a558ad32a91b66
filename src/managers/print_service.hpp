#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/remote_session.hpp>
#include "command_serializer.hpp"
#include "draft_store.hpp"
#include "job_orchestrator.hpp"
#include "job_store.hpp"
#include "queue_poller.hpp"
#include "session_lifecycle.hpp"
#include "state_store.hpp"

// Headless facade over the connection, job and queue machinery. Any
// frontend (the REPL, tests) drives the system through this.
class PrintService {
public:
    PrintService(Config config, SessionOpener opener, fs::path state_dir);
    ~PrintService();

    PrintService(const PrintService&) = delete;
    PrintService& operator=(const PrintService&) = delete;

    // Load job history, drafts and preferences. A corrupt file is logged
    // and reported; the service still starts empty.
    Result<void> init();

    // ── Connection ────────────────────────────────────────────

    Result<void> connect(const ConnectionConfig& conn, StatusCallback progress = nullptr);
    Result<void> disconnect();
    ConnectionStatus status() const;
    bool is_connected() const;

    // Last successfully used connection (no secret), else the config's.
    ConnectionConfig preferred_connection() const;

    // ── Jobs ──────────────────────────────────────────────────

    // Empty queue -> default queue. Drops any draft for the file.
    Result<SubmitOutcome> submit(const std::string& file, const std::string& queue,
                                 const PrintSettings& settings);
    Result<PrintJob> cancel(const std::string& job_id);
    Result<void> remove_job(const std::string& job_id);

    // Drop terminal jobs (and their backups) older than `days`. Returns count.
    int cleanup(int days);

    std::vector<PrintJob> list_jobs() const;

    // Exact id, or a unique prefix or suffix of one.
    Result<PrintJob> find_job(const std::string& ref) const;

    // ── Queues ────────────────────────────────────────────────

    const std::vector<std::string>& queues() const { return config_.queues(); }
    std::optional<QueueSnapshot> queue_snapshot(const std::string& queue) const;

    // Immediate poll round. NotConnected without a session; Ok(false) when
    // it coalesced with a round already running.
    Result<bool> refresh();

    // ── Drafts ────────────────────────────────────────────────

    DraftJob save_draft(DraftJob draft);
    std::vector<DraftJob> drafts() const;
    std::optional<DraftJob> draft(const std::string& source_path) const;
    bool discard_draft(const std::string& source_path);
    Result<SubmitOutcome> send_draft(const std::string& source_path);

    // ── Preferences ───────────────────────────────────────────

    std::string default_queue() const;
    Result<void> set_default_queue(const std::string& queue);

    // ── Listeners ─────────────────────────────────────────────

    void add_status_listener(SessionLifecycle::StatusListener listener);
    void add_job_listener(JobStore::ChangeListener listener);
    void add_snapshot_listener(QueuePoller::SnapshotCallback listener);

    const Config& config() const { return config_; }
    StateStore& state_store() { return state_; }

private:
    Config config_;
    StateStore state_;
    JobStore jobs_;
    DraftStore drafts_;
    CommandSerializer serializer_;
    SessionLifecycle lifecycle_;
    JobOrchestrator orchestrator_;

    mutable std::mutex prefs_mutex_;
    Preferences prefs_;
    std::optional<ConnectionConfig> last_connection_;

    std::mutex save_mutex_;

    mutable std::mutex poller_mutex_;
    std::unique_ptr<QueuePoller> poller_;

    mutable std::mutex snapshot_mutex_;
    std::map<std::string, QueueSnapshot> snapshots_;
    std::vector<QueuePoller::SnapshotCallback> snapshot_listeners_;

    void on_status(const ConnectionStatus& status);
    void start_poller();
    void stop_poller();
    void persist();
};
