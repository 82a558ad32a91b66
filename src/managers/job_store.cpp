#include "job_store.hpp"
#include <core/utils.hpp>
#include <algorithm>

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Uploading: return "uploading";
        case JobStatus::Queued:    return "queued";
        case JobStatus::Printing:  return "printing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

std::optional<JobStatus> parse_job_status(const std::string& name) {
    static const std::pair<const char*, JobStatus> table[] = {
        {"pending", JobStatus::Pending},     {"uploading", JobStatus::Uploading},
        {"queued", JobStatus::Queued},       {"printing", JobStatus::Printing},
        {"completed", JobStatus::Completed}, {"failed", JobStatus::Failed},
        {"cancelled", JobStatus::Cancelled},
    };
    for (const auto& [n, s] : table) {
        if (name == n) return s;
    }
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

Result<PrintJob> JobStore::create(PrintJob job) {
    if (job.id.empty()) {
        return Result<PrintJob>::Err(ErrorKind::Storage, "Job id is empty");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.count(job.id)) {
            return Result<PrintJob>::Err(ErrorKind::Storage, "Duplicate job id: " + job.id);
        }
        if (job.created_at.empty()) job.created_at = now_iso();
        if (job.updated_at.empty()) job.updated_at = job.created_at;
        job.seq = next_seq_++;
        jobs_[job.id] = job;
    }
    notify_change(job);
    return Result<PrintJob>::Ok(job);
}

Result<PrintJob> JobStore::update(const std::string& id, const JobPatch& patch,
                                  const Guard& guard) {
    PrintJob updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return Result<PrintJob>::Err(ErrorKind::NotFound, "No job " + id);
        }
        if (guard) {
            std::string refusal = guard(it->second);
            if (!refusal.empty()) {
                return Result<PrintJob>::Err(ErrorKind::InvalidTransition, refusal);
            }
        }

        PrintJob& job = it->second;
        if (patch.status) job.status = *patch.status;
        if (patch.remote_id) job.remote_id = *patch.remote_id;
        if (patch.error) job.error = *patch.error;
        if (patch.staged_path) job.staged_path = *patch.staged_path;
        if (patch.submit_seq) job.submit_seq = *patch.submit_seq;
        job.updated_at = now_iso();
        updated = job;
    }
    notify_change(updated);
    return Result<PrintJob>::Ok(updated);
}

std::optional<PrintJob> JobStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::vector<PrintJob> JobStore::list() const {
    std::vector<PrintJob> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(jobs_.size());
        for (const auto& [id, job] : jobs_) out.push_back(job);
    }
    // ISO timestamps sort lexically; seq breaks same-second ties
    std::sort(out.begin(), out.end(), [](const PrintJob& a, const PrintJob& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.seq > b.seq;
    });
    return out;
}

Result<void> JobStore::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.erase(id) == 0) {
            return Result<void>::Err(ErrorKind::NotFound, "No job " + id);
        }
    }
    std::vector<RemoveListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = remove_listeners_;
    }
    for (auto& l : listeners) l(id);
    return Result<void>::Ok();
}

void JobStore::restore(std::vector<PrintJob> jobs) {
    std::sort(jobs.begin(), jobs.end(), [](const PrintJob& a, const PrintJob& b) {
        return a.created_at < b.created_at;
    });
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();
    for (auto& job : jobs) {
        job.seq = next_seq_++;
        jobs_[job.id] = std::move(job);
    }
}

void JobStore::add_change_listener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    change_listeners_.push_back(std::move(listener));
}

void JobStore::add_remove_listener(RemoveListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    remove_listeners_.push_back(std::move(listener));
}

void JobStore::notify_change(const PrintJob& job) {
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = change_listeners_;
    }
    for (auto& l : listeners) l(job);
}
