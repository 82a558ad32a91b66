#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/print_settings.hpp>
#include <core/types.hpp>

enum class JobStatus {
    Pending,
    Uploading,
    Queued,
    Printing,
    Completed,
    Failed,
    Cancelled,
};

const char* job_status_name(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& name);
bool is_terminal(JobStatus status);

struct PrintJob {
    std::string id;
    std::string name;                       // display name, "<stem>-copy<k><ext>" for copies
    std::string source_path;
    std::string queue;
    PrintSettings settings;
    JobStatus status = JobStatus::Pending;
    std::optional<std::string> remote_id;   // "psts-123" from lpr
    std::optional<std::string> error;
    std::optional<std::string> staged_path; // remote path of the uploaded file
    std::string created_at;
    std::string updated_at;

    int copy_index = 0;                     // 1-based within a multi-copy submit, 0 otherwise
    uint64_t submit_seq = 0;                // serializer sequence of the lpr command
    uint64_t seq = 0;                       // store insertion order
};

// Fields to overwrite; unset fields are left alone.
struct JobPatch {
    std::optional<JobStatus> status;
    std::optional<std::string> remote_id;
    std::optional<std::string> error;
    std::optional<std::string> staged_path;
    std::optional<uint64_t> submit_seq;
};

class JobStore {
public:
    using ChangeListener = std::function<void(const PrintJob&)>;
    using RemoveListener = std::function<void(const std::string& job_id)>;

    // Checked under the store lock before a patch applies. Returns an empty
    // string to allow, or the reason to refuse.
    using Guard = std::function<std::string(const PrintJob&)>;

    Result<PrintJob> create(PrintJob job);
    Result<PrintJob> update(const std::string& id, const JobPatch& patch,
                            const Guard& guard = nullptr);
    std::optional<PrintJob> get(const std::string& id) const;
    std::vector<PrintJob> list() const;     // newest first
    Result<void> remove(const std::string& id);

    // Replace everything with persisted jobs (no listeners fired).
    void restore(std::vector<PrintJob> jobs);

    void add_change_listener(ChangeListener listener);
    void add_remove_listener(RemoveListener listener);

private:
    mutable std::mutex mutex_;
    std::map<std::string, PrintJob> jobs_;
    uint64_t next_seq_ = 1;

    std::mutex listener_mutex_;
    std::vector<ChangeListener> change_listeners_;
    std::vector<RemoveListener> remove_listeners_;

    void notify_change(const PrintJob& job);
};
