#include "../base_cli.hpp"
#include "../print_options.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <managers/job_log.hpp>

// ── Helpers ──────────────────────────────────────────────────

// Pad a colored cell: fmt width would count the escape codes.
static std::string pad_status(JobStatus status, int width) {
    std::string name = job_status_name(status);
    int pad = width - static_cast<int>(name.size());
    return colored_status(status) + std::string(pad > 0 ? pad : 0, ' ');
}

static void print_outcome(const SubmitOutcome& outcome) {
    for (const auto& job : outcome.jobs) {
        if (job.status == JobStatus::Failed) {
            std::cout << theme::fail(fmt::format("{} {}: {}", short_id(job.id), job.name,
                                                 job.error.value_or("failed")));
        } else {
            std::cout << theme::ok(fmt::format("{} {} {} ({})", short_id(job.id), job.name,
                                               job_status_name(job.status),
                                               job.remote_id.value_or("-")));
        }
    }
    if (outcome.jobs.size() > 1) {
        std::cout << theme::kv("Submitted", fmt::format("{} of {}", outcome.success_count,
                                                        outcome.jobs.size()));
        if (!outcome.failed_copies.empty()) {
            std::cout << theme::kv("Failed", fmt::format("copies {}",
                                                         fmt::join(outcome.failed_copies, ", ")));
        }
    }
}

void report_submission(const Result<SubmitOutcome>& result) {
    print_outcome(result.value);
    if (result.is_err()) {
        print_failure("Print", result.error, result.kind);
    }
}

// ── Commands ─────────────────────────────────────────────────

static void do_print(BaseCLI& cli, const std::string& arg) {
    auto req = parse_print_options(split_args(arg));
    if (req.is_err()) {
        std::cout << theme::fail(req.error);
        std::cout << theme::step("Usage: print <file> [queue] [-n N] [--duplex none|long|short] "
                                 "[--paper A4|A3] [--landscape] [--nup N] [--pages 1-3]");
        return;
    }
    if (!cli.require_connection()) {
        std::cout << theme::step("Or keep the settings for later with 'draft'.");
        return;
    }

    auto& service = cli.service();
    std::string queue = req.value.queue.empty() ? service.default_queue() : req.value.queue;
    std::cout << theme::info(fmt::format("Printing {} on {}", req.value.file, queue));
    std::cout << theme::dim("    " + describe_settings(req.value.settings)) << "\n";

    report_submission(service.submit(req.value.file, req.value.queue, req.value.settings));
}

static void do_jobs(BaseCLI& cli, const std::string& arg) {
    auto jobs = cli.service().list_jobs();
    if (jobs.empty()) {
        std::cout << theme::dim("    No jobs.") << "\n";
        return;
    }

    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format("  {:<9} {:<28} {:<8} {:<10} {:<12} {}",
                             "ID", "NAME", "QUEUE", "STATUS", "REMOTE", "AGE")
              << theme::color::RESET << "\n";
    for (const auto& job : jobs) {
        std::string name = job.name.size() > 28 ? job.name.substr(0, 25) + "..." : job.name;
        std::cout << fmt::format("  {:<9} {:<28} {:<8} ", short_id(job.id), name, job.queue)
                  << pad_status(job.status, 10)
                  << fmt::format(" {:<12} {}\n", job.remote_id.value_or("-"),
                                 format_age(job.created_at));
    }
    std::cout << "\n";
}

static void do_job(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: job <id>");
        return;
    }
    auto found = cli.service().find_job(arg);
    if (found.is_err()) {
        std::cout << theme::fail(found.error);
        return;
    }
    const auto& job = found.value;

    std::cout << theme::section(job.name);
    std::cout << theme::kv("ID", job.id);
    std::cout << theme::kv("Status", colored_status(job.status));
    std::cout << theme::kv("Queue", job.queue);
    std::cout << theme::kv("Remote", job.remote_id.value_or("-"));
    std::cout << theme::kv("File", job.source_path);
    if (job.staged_path) std::cout << theme::kv("Staged", *job.staged_path);
    std::cout << theme::kv("Settings", describe_settings(job.settings));
    std::cout << theme::kv("Created", format_timestamp(job.created_at)
                           + " (" + format_age(job.created_at) + " ago)");
    std::cout << theme::kv("Updated", format_timestamp(job.updated_at));
    if (job.error) std::cout << theme::kv("Error", theme::red(*job.error));
    std::cout << theme::kv("Log", job_log_path(job.id));
    std::cout << "\n";
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: cancel <id>");
        return;
    }
    auto result = cli.service().cancel(arg);
    if (result.is_err()) {
        print_failure("Cancel failed", result.error, result.kind);
        return;
    }
    std::cout << theme::ok(fmt::format("Cancelled {} ({})", result.value.name,
                                       short_id(result.value.id)));
}

static void do_remove(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: remove <id>");
        return;
    }
    auto found = cli.service().find_job(arg);
    if (found.is_err()) {
        std::cout << theme::fail(found.error);
        return;
    }
    auto result = cli.service().remove_job(found.value.id);
    if (result.is_err()) {
        print_failure("Remove failed", result.error, result.kind);
        if (result.kind == ErrorKind::InvalidTransition) {
            std::cout << theme::step("Cancel it first, or wait for it to finish.");
        }
        return;
    }
    std::cout << theme::ok("Removed " + found.value.name);
}

static void do_cleanup(BaseCLI& cli, const std::string& arg) {
    int days = DEFAULT_HISTORY_DAYS;
    if (!arg.empty()) {
        days = safe_stoi(arg, -1);
        if (days < 0) {
            std::cout << theme::fail("Usage: cleanup [days]");
            return;
        }
    }
    int removed = cli.service().cleanup(days);
    std::cout << theme::ok(fmt::format("Removed {} finished job{} older than {} day{}",
                                       removed, removed == 1 ? "" : "s",
                                       days, days == 1 ? "" : "s"));
}

void register_jobs_commands(BaseCLI& cli) {
    cli.add_command("print", do_print, "Print a file: print <file> [queue] [options]");
    cli.add_command("jobs", do_jobs, "List print jobs");
    cli.add_command("job", do_job, "Show one job");
    cli.add_command("cancel", do_cancel, "Cancel a job");
    cli.add_command("remove", do_remove, "Forget a finished job");
    cli.add_command("cleanup", do_cleanup, "Forget finished jobs older than N days");
}
