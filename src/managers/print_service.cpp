#include "print_service.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

PrintService::PrintService(Config config, SessionOpener opener, fs::path state_dir)
    : config_(std::move(config)),
      state_(std::move(state_dir)),
      lifecycle_(serializer_, std::move(opener),
                 RetryPolicy{config_.connect_attempts(), config_.retry_backoff_ms(), CONNECT_TICK_MS}),
      orchestrator_(jobs_, serializer_, config_.staging_dir()) {
    lifecycle_.add_status_listener([this](const ConnectionStatus& s) { on_status(s); });

    jobs_.add_change_listener([this](const PrintJob&) { persist(); });
    jobs_.add_remove_listener([this](const std::string& id) {
        state_.remove_backup(id);
        persist();
    });

    orchestrator_.set_created_hook([this](const PrintJob& job) {
        auto backup = state_.backup_source(job.id, job.source_path);
        if (backup.is_err()) {
            socprint_log("service: " + backup.error);
        }
    });
}

PrintService::~PrintService() {
    stop_poller();
    auto r = lifecycle_.disconnect();
    if (r.is_err()) socprint_log("service: disconnect on shutdown: " + r.error);
}

Result<void> PrintService::init() {
    auto prefs = state_.load_preferences();
    if (prefs.is_ok()) {
        std::lock_guard<std::mutex> lock(prefs_mutex_);
        prefs_ = prefs.value;
    } else {
        socprint_log("service: " + prefs.error);
    }

    auto loaded = state_.load();
    if (loaded.is_err()) {
        socprint_log("service: " + loaded.error);
        return Result<void>::Err(loaded.kind, loaded.error);
    }
    jobs_.restore(loaded.value.jobs);
    drafts_.restore(loaded.value.drafts);
    {
        std::lock_guard<std::mutex> lock(prefs_mutex_);
        last_connection_ = loaded.value.last_connection;
    }
    socprint_log(fmt::format("service: loaded {} jobs, {} drafts",
                             loaded.value.jobs.size(), loaded.value.drafts.size()));
    return Result<void>::Ok();
}

void PrintService::persist() {
    // Snapshot under the save lock so the last writer writes the newest state
    std::lock_guard<std::mutex> lock(save_mutex_);
    PersistedState state;
    state.jobs = jobs_.list();
    state.drafts = drafts_.list();
    {
        std::lock_guard<std::mutex> prefs_lock(prefs_mutex_);
        state.last_connection = last_connection_;
    }
    auto r = state_.save(state);
    if (r.is_err()) {
        socprint_log("service: save failed: " + r.error);
    }
}

// ── Connection ──────────────────────────────────────────────

Result<void> PrintService::connect(const ConnectionConfig& conn, StatusCallback progress) {
    auto r = lifecycle_.connect(conn, progress);
    if (r.is_ok()) {
        ConnectionConfig saved = conn;
        saved.secret.clear();
        {
            std::lock_guard<std::mutex> lock(prefs_mutex_);
            last_connection_ = saved;
        }
        persist();
    }
    return r;
}

Result<void> PrintService::disconnect() {
    return lifecycle_.disconnect();
}

ConnectionStatus PrintService::status() const {
    return lifecycle_.status();
}

bool PrintService::is_connected() const {
    return lifecycle_.is_connected();
}

ConnectionConfig PrintService::preferred_connection() const {
    std::lock_guard<std::mutex> lock(prefs_mutex_);
    if (last_connection_ && !last_connection_->user.empty()) return *last_connection_;
    return config_.connection();
}

void PrintService::on_status(const ConnectionStatus& status) {
    // The poller belongs to one session; a reconnect gets a fresh one
    if (std::holds_alternative<Connected>(status)) {
        start_poller();
    } else {
        stop_poller();
    }
}

void PrintService::start_poller() {
    std::lock_guard<std::mutex> lock(poller_mutex_);
    if (poller_) return;
    poller_ = std::make_unique<QueuePoller>(
        serializer_, config_.queues(), std::chrono::seconds(config_.poll_interval()));
    poller_->set_snapshot_callback([this](const QueueSnapshot& snap) {
        std::vector<QueuePoller::SnapshotCallback> listeners;
        {
            std::lock_guard<std::mutex> lock(snapshot_mutex_);
            snapshots_[snap.queue] = snap;
            listeners = snapshot_listeners_;
        }
        for (auto& l : listeners) l(snap);
    });
    poller_->set_listing_callback(
        [this](const std::string& queue, const std::vector<LpqEntry>& entries, uint64_t seq) {
            orchestrator_.on_queue_listing(queue, entries, seq);
        });
    poller_->start();
}

void PrintService::stop_poller() {
    std::unique_ptr<QueuePoller> old;
    {
        std::lock_guard<std::mutex> lock(poller_mutex_);
        old.swap(poller_);
    }
    // Joins the poll thread outside the lock
    old.reset();
}

// ── Jobs ────────────────────────────────────────────────────

Result<SubmitOutcome> PrintService::submit(const std::string& file, const std::string& queue,
                                           const PrintSettings& settings) {
    std::string target = queue.empty() ? default_queue() : queue;
    if (drafts_.remove(file)) {
        persist();
    }
    return orchestrator_.submit(file, target, settings);
}

Result<PrintJob> PrintService::cancel(const std::string& job_id) {
    auto job = find_job(job_id);
    if (job.is_err()) return job;
    return orchestrator_.cancel(job.value.id);
}

Result<void> PrintService::remove_job(const std::string& job_id) {
    auto job = find_job(job_id);
    if (job.is_err()) return Result<void>::Err(job.kind, job.error);
    if (!is_terminal(job.value.status)) {
        return Result<void>::Err(ErrorKind::InvalidTransition,
                                 fmt::format("Job {} is still {}; cancel it first", job.value.id,
                                             job_status_name(job.value.status)));
    }
    return jobs_.remove(job.value.id);
}

int PrintService::cleanup(int days) {
    int removed = 0;
    for (const auto& job : jobs_.list()) {
        if (!is_terminal(job.status)) continue;
        if (!older_than_days(job.updated_at, days)) continue;
        if (jobs_.remove(job.id).is_ok()) ++removed;
    }
    socprint_log(fmt::format("service: cleanup({}) removed {} jobs", days, removed));
    return removed;
}

std::vector<PrintJob> PrintService::list_jobs() const {
    return jobs_.list();
}

Result<PrintJob> PrintService::find_job(const std::string& ref) const {
    if (auto exact = jobs_.get(ref)) {
        return Result<PrintJob>::Ok(*exact);
    }
    std::vector<PrintJob> matches;
    if (!ref.empty()) {
        for (const auto& j : jobs_.list()) {
            if (j.id.size() < ref.size()) continue;
            bool prefix = j.id.compare(0, ref.size(), ref) == 0;
            bool suffix = j.id.compare(j.id.size() - ref.size(), ref.size(), ref) == 0;
            if (prefix || suffix) matches.push_back(j);
        }
    }
    if (matches.size() == 1) return Result<PrintJob>::Ok(matches.front());
    if (matches.empty()) {
        return Result<PrintJob>::Err(ErrorKind::NotFound, "No job " + ref);
    }
    return Result<PrintJob>::Err(ErrorKind::NotFound,
                                 fmt::format("'{}' matches {} jobs", ref, matches.size()));
}

// ── Queues ──────────────────────────────────────────────────

std::optional<QueueSnapshot> PrintService::queue_snapshot(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    auto it = snapshots_.find(queue);
    if (it == snapshots_.end()) return std::nullopt;
    return it->second;
}

Result<bool> PrintService::refresh() {
    std::lock_guard<std::mutex> lock(poller_mutex_);
    if (!poller_) {
        return Result<bool>::Err(ErrorKind::NotConnected, "Not connected");
    }
    return Result<bool>::Ok(poller_->refresh_now());
}

// ── Drafts ──────────────────────────────────────────────────

DraftJob PrintService::save_draft(DraftJob draft) {
    auto saved = drafts_.save(std::move(draft));
    persist();
    return saved;
}

std::vector<DraftJob> PrintService::drafts() const {
    return drafts_.list();
}

std::optional<DraftJob> PrintService::draft(const std::string& source_path) const {
    return drafts_.get(source_path);
}

bool PrintService::discard_draft(const std::string& source_path) {
    bool removed = drafts_.remove(source_path);
    if (removed) persist();
    return removed;
}

Result<SubmitOutcome> PrintService::send_draft(const std::string& source_path) {
    auto d = drafts_.get(source_path);
    if (!d) {
        return Result<SubmitOutcome>::Err(ErrorKind::NotFound, "No draft for " + source_path);
    }
    return submit(d->source_path, d->queue, d->settings);
}

// ── Preferences ─────────────────────────────────────────────

std::string PrintService::default_queue() const {
    std::lock_guard<std::mutex> lock(prefs_mutex_);
    if (!prefs_.default_queue.empty()) return prefs_.default_queue;
    return config_.queues().empty() ? "" : config_.queues().front();
}

Result<void> PrintService::set_default_queue(const std::string& queue) {
    if (queue.empty()) {
        return Result<void>::Err(ErrorKind::Config, "Queue name is empty");
    }
    Preferences prefs;
    {
        std::lock_guard<std::mutex> lock(prefs_mutex_);
        prefs_.default_queue = queue;
        prefs = prefs_;
    }
    return state_.save_preferences(prefs);
}

// ── Listeners ───────────────────────────────────────────────

void PrintService::add_status_listener(SessionLifecycle::StatusListener listener) {
    lifecycle_.add_status_listener(std::move(listener));
}

void PrintService::add_job_listener(JobStore::ChangeListener listener) {
    jobs_.add_change_listener(std::move(listener));
}

void PrintService::add_snapshot_listener(QueuePoller::SnapshotCallback listener) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_listeners_.push_back(std::move(listener));
}
