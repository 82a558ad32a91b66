#include "print_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <variant>
#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <core/time_utils.hpp>
#include <managers/job_log.hpp>
#include <platform/terminal.hpp>
#include <readline/readline.h>
#include <readline/history.h>

namespace {

// readline's callback interface takes a plain function pointer.
PrintCLI* g_active_cli = nullptr;

std::string describe_status(const ConnectionStatus& status) {
    if (auto* c = std::get_if<Connected>(&status)) {
        return "Connected at " + format_timestamp(c->connected_at);
    }
    if (auto* f = std::get_if<Failed>(&status)) {
        return fmt::format("Connection failed at {}: {}",
                           format_timestamp(f->last_attempt_at), f->message);
    }
    if (std::holds_alternative<Connecting>(status)) {
        return "Connecting...";
    }
    return "Disconnected";
}

} // namespace

PrintCLI::PrintCLI(std::unique_ptr<PrintService> service)
    : BaseCLI(std::move(service)) {
    register_all_commands();
    subscribe();
}

void PrintCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Disconnecting...") << "\n";
        request_quit();
    }, "Exit socprint");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Disconnecting...") << "\n";
        request_quit();
    }, "Exit socprint");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_connection_commands(*this);
    register_jobs_commands(*this);
    register_queues_commands(*this);
    register_drafts_commands(*this);
    register_credentials_commands(*this);
}

void PrintCLI::subscribe() {
    service_->add_status_listener([this](const ConnectionStatus& status) {
        std::string name = status_name(status);
        {
            // Connecting ticks once a second; only the transition is news.
            std::lock_guard<std::mutex> lock(seen_mutex_);
            if (name == last_status_name_) return;
            last_status_name_ = name;
        }
        if (std::holds_alternative<Failed>(status)) {
            post_notice(theme::red(describe_status(status)));
        } else if (std::holds_alternative<Connected>(status)) {
            post_notice(theme::green(describe_status(status)));
        } else {
            post_notice(describe_status(status));
        }
    });

    service_->add_job_listener([this](const PrintJob& job) {
        {
            std::lock_guard<std::mutex> lock(seen_mutex_);
            auto it = seen_status_.find(job.id);
            if (it != seen_status_.end() && it->second == job.status) return;
            seen_status_[job.id] = job.status;
        }
        std::string text = fmt::format("{} {} on {}: {}", short_id(job.id), job.name,
                                       job.queue, colored_status(job.status));
        if (job.status == JobStatus::Failed && job.error) {
            text += " (" + *job.error + ")";
        }
        post_notice(text);
    });

    service_->add_snapshot_listener([this](const QueueSnapshot& snap) {
        bool failing = snap.error.has_value();
        {
            std::lock_guard<std::mutex> lock(seen_mutex_);
            auto it = queue_failing_.find(snap.queue);
            bool was = it != queue_failing_.end() && it->second;
            queue_failing_[snap.queue] = failing;
            if (failing == was) return;
        }
        if (failing) {
            post_notice(theme::yellow(fmt::format("{}: {}", snap.queue, *snap.error)));
        } else {
            post_notice(snap.queue + " is listing again");
        }
    });
}

void PrintCLI::post_notice(const std::string& text) {
    std::lock_guard<std::mutex> lock(notice_mutex_);
    if (in_command_) {
        std::cout << theme::notice(text) << std::flush;
    } else {
        pending_notices_.push_back(text);
    }
}

void PrintCLI::flush_notices() {
    std::vector<std::string> notices;
    {
        std::lock_guard<std::mutex> lock(notice_mutex_);
        notices.swap(pending_notices_);
    }

    std::string prompt = get_prompt_string();
    bool prompt_changed = prompt != current_prompt_;
    if (notices.empty() && !prompt_changed) return;

    if (!notices.empty()) {
        // Clear the input line, print above it, then let readline redraw.
        std::cout << "\r\033[K";
        for (const auto& n : notices) std::cout << theme::notice(n);
        std::cout << std::flush;
        rl_on_new_line();
    }
    if (prompt_changed) {
        current_prompt_ = prompt;
        rl_set_prompt(current_prompt_.c_str());
    }
    rl_redisplay();
}

void PrintCLI::on_line(char* raw) {
    PrintCLI* self = g_active_cli;
    if (!self) {
        free(raw);
        return;
    }
    if (!raw) {
        // EOF / Ctrl-D
        std::cout << "\n";
        self->request_quit();
        rl_callback_handler_remove();
        return;
    }

    std::string line = raw;
    free(raw);
    if (!line.empty()) add_history(line.c_str());

    {
        std::lock_guard<std::mutex> lock(self->notice_mutex_);
        self->in_command_ = true;
    }
    self->execute_line(line);
    {
        std::lock_guard<std::mutex> lock(self->notice_mutex_);
        self->in_command_ = false;
    }

    if (!self->running_) {
        rl_callback_handler_remove();
        return;
    }
    self->current_prompt_ = self->get_prompt_string();
    rl_set_prompt(self->current_prompt_.c_str());
}

void PrintCLI::run_repl() {
    std::cout << theme::banner();

    const auto& conn = service_->preferred_connection();
    std::cout << theme::section("socprint");
    std::cout << theme::kv("Host", fmt::format("{}:{}", conn.host, conn.port));
    std::cout << theme::kv("User", conn.user.empty() ? "(not set)" : conn.user);
    std::cout << theme::kv("Queues", fmt::format("{}", fmt::join(service_->queues(), ", ")));
    std::cout << theme::kv("Default", service_->default_queue());
    std::cout << theme::kv("Log", socprint_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    g_active_cli = this;
    current_prompt_ = get_prompt_string();
    rl_callback_handler_install(current_prompt_.c_str(), &PrintCLI::on_line);

    while (running_) {
        if (platform::poll_stdin(200)) {
            rl_callback_read_char();
        }
        if (running_) flush_notices();
    }

    rl_callback_handler_remove();
    g_active_cli = nullptr;

    {
        std::lock_guard<std::mutex> lock(notice_mutex_);
        in_command_ = true;
    }
    auto r = service_->disconnect();
    if (r.is_err()) {
        socprint_log("disconnect on exit: " + r.error);
    }
}

void PrintCLI::run_command(const std::string& command, const std::string& args) {
    {
        std::lock_guard<std::mutex> lock(notice_mutex_);
        in_command_ = true;
    }
    execute_command(command, args);
}
