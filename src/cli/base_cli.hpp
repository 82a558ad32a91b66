#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <vector>
#include <core/config.hpp>
#include <managers/print_service.hpp>

class BaseCLI {
public:
    explicit BaseCLI(std::unique_ptr<PrintService> service);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_connection();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Split "cmd rest of line" and dispatch. Blank lines are ignored.
    void execute_line(const std::string& line);

    PrintService& service() { return *service_; }

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::unique_ptr<PrintService> service_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Shared output helpers for the command files.
std::string colored_status(JobStatus status);
void print_failure(const std::string& what, const std::string& error, ErrorKind kind);
std::vector<std::string> split_args(const std::string& arg);
std::string short_id(const std::string& id);

// Per-copy lines plus counts for a submission (commands/jobs.cpp).
void report_submission(const Result<SubmitOutcome>& result);
