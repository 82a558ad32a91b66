#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <variant>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <managers/job_log.hpp>

BaseCLI::BaseCLI(std::unique_ptr<PrintService> service)
    : service_(std::move(service)) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_connection() {
    if (!service_->is_connected()) {
        std::cout << theme::fail("Not connected.");
        std::cout << theme::step("Run 'connect' first.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::execute_line(const std::string& line) {
    std::string trimmed = line;
    trim(trimmed);
    if (trimmed.empty()) return;

    auto space = trimmed.find(' ');
    std::string command = trimmed.substr(0, space);
    std::string args;
    if (space != std::string::npos) {
        args = trimmed.substr(space + 1);
        trim(args);
    }
    execute_command(command, args);
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connection", {"connect", "disconnect", "status"}},
        {"Jobs",       {"print", "jobs", "job", "cancel", "remove", "cleanup"}},
        {"Queues",     {"queues", "refresh", "default"}},
        {"Drafts",     {"draft", "drafts", "send", "discard"}},
        {"Setup",      {"credentials"}},
        {"General",    {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::ORANGE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string head = rl_esc(theme::color::ORANGE) + "socprint" + rl_esc(theme::color::RESET);
    auto status = service_->status();

    if (std::holds_alternative<Connected>(status)) {
        return head + ":"
             + rl_esc(theme::color::GREEN) + service_->preferred_connection().host
             + rl_esc(theme::color::RESET) + "> ";
    } else if (std::holds_alternative<Connecting>(status)) {
        return head + ":"
             + rl_esc(theme::color::YELLOW) + "connecting"
             + rl_esc(theme::color::RESET) + "> ";
    } else if (std::holds_alternative<Failed>(status)) {
        return head + ":"
             + rl_esc(theme::color::RED) + "offline"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return head + "> ";
}

std::string colored_status(JobStatus status) {
    std::string name = job_status_name(status);
    switch (status) {
        case JobStatus::Completed: return theme::green(name);
        case JobStatus::Failed:    return theme::red(name);
        case JobStatus::Cancelled: return theme::dim(name);
        case JobStatus::Printing:  return theme::blue(name);
        case JobStatus::Pending:
        case JobStatus::Uploading:
        case JobStatus::Queued:    return theme::yellow(name);
    }
    return name;
}

void print_failure(const std::string& what, const std::string& error, ErrorKind kind) {
    std::cout << theme::fail(what + ": " + error);
    socprint_log(fmt::format("{} failed [{}]: {}", what, error_kind_name(kind), error));
    if (kind == ErrorKind::NotConnected) {
        std::cout << theme::step("Run 'connect' first.");
    } else if (kind == ErrorKind::AlreadyConnecting) {
        std::cout << theme::step("Wait for the current attempt, or run 'disconnect'.");
    }
}

std::vector<std::string> split_args(const std::string& arg) {
    // Whitespace split with double-quote grouping, for paths with spaces.
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    bool have = false;
    for (char c : arg) {
        if (c == '"') {
            quoted = !quoted;
            have = true;
        } else if (!quoted && (c == ' ' || c == '\t')) {
            if (have) out.push_back(cur);
            cur.clear();
            have = false;
        } else {
            cur += c;
            have = true;
        }
    }
    if (have) out.push_back(cur);
    return out;
}

std::string short_id(const std::string& id) {
    // Ids are "<date>-<time>-<ms>-<random>"; the random tail is what differs.
    auto dash = id.rfind('-');
    return dash == std::string::npos ? id : id.substr(dash + 1);
}
