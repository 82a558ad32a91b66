#include "job_orchestrator.hpp"
#include "command_serializer.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <filesystem>

namespace fs = std::filesystem;

JobOrchestrator::JobOrchestrator(JobStore& store, CommandSerializer& serializer,
                                 std::string staging_dir)
    : store_(store), serializer_(serializer), staging_dir_(std::move(staging_dir)) {
    while (staging_dir_.size() > 1 && staging_dir_.back() == '/') staging_dir_.pop_back();
}

bool JobOrchestrator::can_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::Uploading || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        case JobStatus::Uploading:
            return to == JobStatus::Queued || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        case JobStatus::Queued:
            return to == JobStatus::Printing || to == JobStatus::Completed ||
                   to == JobStatus::Failed || to == JobStatus::Cancelled;
        case JobStatus::Printing:
            return to == JobStatus::Completed || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        case JobStatus::Completed:
        case JobStatus::Failed:
        case JobStatus::Cancelled:
            return false;
    }
    return false;
}

std::string JobOrchestrator::staging_path(const std::string& job_id, const std::string& file) const {
    return fmt::format("{}/{}{}", staging_dir_, job_id, fs::path(file).extension().string());
}

Result<PrintJob> JobOrchestrator::transition(const std::string& job_id, JobStatus to, JobPatch patch) {
    patch.status = to;
    auto result = store_.update(job_id, patch, [job_id, to](const PrintJob& job) -> std::string {
        if (can_transition(job.status, to)) return "";
        return fmt::format("Job {} cannot go from {} to {}", job_id,
                           job_status_name(job.status), job_status_name(to));
    });
    if (result.is_ok()) {
        std::string line = fmt::format("status -> {}", job_status_name(to));
        if (patch.remote_id) line += " remote_id=" + *patch.remote_id;
        if (patch.error) line += " error=" + *patch.error;
        append_job_log(job_id, line);
    } else {
        socprint_log("orchestrator: " + result.error);
    }
    return result;
}

void JobOrchestrator::fail_job(const std::string& job_id, const std::string& message) {
    JobPatch patch;
    patch.error = message;
    auto r = transition(job_id, JobStatus::Failed, patch);
    if (r.is_err()) {
        // Cancelled meanwhile; keep the reason on the record anyway
        JobPatch note;
        note.error = message;
        store_.update(job_id, note);
    }
}

bool JobOrchestrator::cancelled(const std::string& job_id) const {
    auto job = store_.get(job_id);
    return !job || job->status == JobStatus::Cancelled;
}

Result<SubmitOutcome> JobOrchestrator::submit(const std::string& file, const std::string& queue,
                                              const PrintSettings& settings) {
    SubmitOutcome outcome;

    auto valid = validate(settings);
    if (valid.is_err()) {
        return Result<SubmitOutcome>::Err(ErrorKind::Config, valid.error);
    }
    if (queue.empty()) {
        return Result<SubmitOutcome>::Err(ErrorKind::Config, "No queue given");
    }

    fs::path src(file);
    int copies = settings.copies;
    PrintSettings per_copy = settings;
    per_copy.copies = 1;

    std::vector<std::string> ids;
    for (int k = 1; k <= copies; ++k) {
        PrintJob job;
        job.id = generate_job_id();
        job.name = copies > 1
            ? fmt::format("{}-copy{}{}", src.stem().string(), k, src.extension().string())
            : src.filename().string();
        job.source_path = file;
        job.queue = queue;
        job.settings = per_copy;
        job.copy_index = copies > 1 ? k : 0;

        auto created = store_.create(job);
        if (created.is_err()) {
            return Result<SubmitOutcome>::Err(created.kind, created.error);
        }
        append_job_log(job.id, fmt::format("created {} for {} ({})", job.name, queue, file));
        if (on_created_) on_created_(created.value);
        ids.push_back(job.id);
    }

    std::string first_error;
    ErrorKind first_kind = ErrorKind::None;
    for (size_t i = 0; i < ids.size(); ++i) {
        auto r = run_pipeline(ids[i]);
        if (r.is_ok()) {
            ++outcome.success_count;
        } else {
            ++outcome.failure_count;
            outcome.failed_copies.push_back(static_cast<int>(i) + 1);
            if (first_error.empty()) {
                first_error = r.error;
                first_kind = r.kind;
            }
        }
        if (auto j = store_.get(ids[i])) outcome.jobs.push_back(*j);
    }

    if (outcome.failure_count == 0) {
        return Result<SubmitOutcome>::Ok(outcome);
    }

    std::string message = copies > 1
        ? fmt::format("{} of {} copies failed (copies {}): {}", outcome.failure_count, copies,
                      fmt::join(outcome.failed_copies, ", "), first_error)
        : first_error;
    return Result<SubmitOutcome>{false, outcome, message, first_kind};
}

Result<void> JobOrchestrator::run_pipeline(const std::string& job_id) {
    auto job = store_.get(job_id);
    if (!job) return Result<void>::Err(ErrorKind::NotFound, "No job " + job_id);

    auto up = transition(job_id, JobStatus::Uploading);
    if (up.is_err()) {
        return Result<void>::Err(ErrorKind::InvalidTransition, up.error);
    }

    // Stage
    std::error_code ec;
    if (!fs::is_regular_file(job->source_path, ec)) {
        std::string msg = "File not found: " + job->source_path;
        fail_job(job_id, msg);
        return Result<void>::Err(ErrorKind::Staging, msg);
    }

    std::string remote = staging_path(job_id, job->source_path);
    auto staged = serializer_.upload(job->source_path, remote);
    if (staged.is_err()) {
        std::string msg = "Staging failed: " + staged.error;
        fail_job(job_id, msg);
        return Result<void>::Err(
            staged.kind == ErrorKind::NotConnected ? ErrorKind::NotConnected : ErrorKind::Staging, msg);
    }
    JobPatch staged_patch;
    staged_patch.staged_path = remote;
    store_.update(job_id, staged_patch);

    if (cancelled(job_id)) {
        return Result<void>::Err(ErrorKind::InvalidTransition, "Job " + job_id + " was cancelled");
    }

    // Submit
    uint64_t seq = 0;
    auto submitted = serializer_.execute(build_lpr_command(job->queue, job->settings, remote), &seq);
    if (submitted.is_err()) {
        std::string msg = "lpr failed: " + submitted.error;
        fail_job(job_id, msg);
        return Result<void>::Err(submitted.kind, msg);
    }

    JobPatch queued;
    queued.remote_id = parse_lpr_request_id(submitted.value);
    queued.submit_seq = seq;
    if (!queued.remote_id) {
        socprint_log("orchestrator: no request id in lpr output for " + job_id);
    }
    auto q = transition(job_id, JobStatus::Queued, queued);
    if (q.is_err()) {
        // Cancelled while lpr ran: withdraw the remote job too
        if (queued.remote_id) {
            JobPatch id_only;
            id_only.remote_id = queued.remote_id;
            store_.update(job_id, id_only);
            auto removed = serializer_.execute(lprm_command(job->queue, *queued.remote_id));
            if (removed.is_err()) {
                socprint_log("orchestrator: lprm after cancel failed: " + removed.error);
            }
        }
        return Result<void>::Err(ErrorKind::InvalidTransition, q.error);
    }
    return Result<void>::Ok();
}

Result<PrintJob> JobOrchestrator::cancel(const std::string& job_id) {
    auto job = store_.get(job_id);
    if (!job) {
        return Result<PrintJob>::Err(ErrorKind::NotFound, "No job " + job_id);
    }
    if (is_terminal(job->status)) {
        return Result<PrintJob>::Err(ErrorKind::InvalidTransition,
                                     fmt::format("Job {} is already {}", job_id,
                                                 job_status_name(job->status)));
    }

    if (!job->remote_id) {
        return transition(job_id, JobStatus::Cancelled);
    }

    auto removed = serializer_.execute(lprm_command(job->queue, *job->remote_id));
    if (removed.is_err()) {
        JobPatch patch;
        patch.error = "Cancel failed: " + removed.error;
        auto failed = transition(job_id, JobStatus::Failed, patch);
        if (failed.is_err()) {
            return failed;
        }
        return Result<PrintJob>::Err(removed.kind, patch.error.value());
    }
    return transition(job_id, JobStatus::Cancelled);
}

void JobOrchestrator::on_queue_listing(const std::string& queue,
                                       const std::vector<LpqEntry>& entries,
                                       uint64_t listing_seq) {
    for (const auto& job : store_.list()) {
        if (job.queue != queue) continue;
        if (job.status != JobStatus::Queued && job.status != JobStatus::Printing) continue;
        if (job.submit_seq >= listing_seq && job.submit_seq != 0) continue;

        if (!job.remote_id) {
            // Nothing to match against; lpr accepted it, assume it went through
            transition(job.id, JobStatus::Completed);
            continue;
        }

        const LpqEntry* entry = find_lpq_entry(entries, *job.remote_id);
        if (!entry) {
            transition(job.id, JobStatus::Completed);
        } else if (entry->is_active() && job.status == JobStatus::Queued) {
            transition(job.id, JobStatus::Printing);
        }
    }
}
