#pragma once

#include "base_cli.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_jobs_commands(BaseCLI& cli);
void register_queues_commands(BaseCLI& cli);
void register_drafts_commands(BaseCLI& cli);
void register_credentials_commands(BaseCLI& cli);

class PrintCLI : public BaseCLI {
public:
    explicit PrintCLI(std::unique_ptr<PrintService> service);

    // Interactive loop. Returns on quit or EOF.
    void run_repl();

    // One command, non-interactive (`socprint jobs`, `socprint print ...`).
    void run_command(const std::string& command, const std::string& args);

    void request_quit() { running_ = false; }

private:
    void register_all_commands();

    // ── Notices ────────────────────────────────────────────────
    // Listener callbacks arrive on service threads. While a command is
    // running they print straight away; at the prompt they are queued and
    // flushed by the REPL thread so readline can redraw the input line.
    void subscribe();
    void post_notice(const std::string& text);
    void flush_notices();

    static void on_line(char* raw);

    std::atomic<bool> running_{true};
    std::atomic<bool> in_command_{false};

    std::mutex notice_mutex_;
    std::vector<std::string> pending_notices_;

    std::mutex seen_mutex_;
    std::map<std::string, JobStatus> seen_status_;
    std::string last_status_name_;
    std::map<std::string, bool> queue_failing_;

    std::string current_prompt_;
};
