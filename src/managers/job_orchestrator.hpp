#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <core/print_settings.hpp>
#include <core/types.hpp>
#include "job_store.hpp"
#include "lpr_helpers.hpp"

class CommandSerializer;

struct SubmitOutcome {
    std::vector<PrintJob> jobs;         // one per copy, final state
    int success_count = 0;
    int failure_count = 0;
    std::vector<int> failed_copies;     // 1-based copy indices
};

// Drives each job through stage -> lpr -> track. All remote work goes
// through the serializer; all job state lives in the store.
class JobOrchestrator {
public:
    using CreatedHook = std::function<void(const PrintJob&)>;

    JobOrchestrator(JobStore& store, CommandSerializer& serializer, std::string staging_dir);

    // N copies become N jobs submitted with copies=1. The result carries
    // the outcome either way; it is an error unless every copy reached Queued.
    Result<SubmitOutcome> submit(const std::string& file, const std::string& queue,
                                 const PrintSettings& settings);

    // Local cancel before lpr has returned an id, lprm afterwards. A failed
    // lprm marks the job Failed with the error.
    Result<PrintJob> cancel(const std::string& job_id);

    // Poller subscription: Queued -> Printing when the job's row is active,
    // Queued/Printing -> Completed when the row is gone. Listings that ran
    // before the job's lpr are ignored.
    void on_queue_listing(const std::string& queue, const std::vector<LpqEntry>& entries,
                          uint64_t listing_seq);

    // Called right after a job record is created.
    void set_created_hook(CreatedHook hook) { on_created_ = std::move(hook); }

    static bool can_transition(JobStatus from, JobStatus to);

    // "<staging_dir>/<job_id><ext>"
    std::string staging_path(const std::string& job_id, const std::string& file) const;

private:
    JobStore& store_;
    CommandSerializer& serializer_;
    std::string staging_dir_;
    CreatedHook on_created_;

    // Runs stage + submit for one job. Returns the error, or Ok once Queued.
    Result<void> run_pipeline(const std::string& job_id);

    Result<PrintJob> transition(const std::string& job_id, JobStatus to, JobPatch patch = {});
    void fail_job(const std::string& job_id, const std::string& message);
    bool cancelled(const std::string& job_id) const;
};
