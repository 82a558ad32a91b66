#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <variant>
#include <unistd.h>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/time_utils.hpp>
#include <managers/job_log.hpp>
#include <platform/terminal.hpp>

// Read a line with echo off. Gives up after a minute of silence.
static std::string read_secret(const std::string& prompt) {
    std::cout << prompt << std::flush;

    std::string secret;
    {
        platform::NoEchoGuard guard;
        while (platform::poll_stdin(60000)) {
            char c = 0;
            if (::read(STDIN_FILENO, &c, 1) != 1) break;
            if (c == '\n' || c == '\r') break;
            if (c == 127 || c == '\b') {
                if (!secret.empty()) secret.pop_back();
                continue;
            }
            secret += c;
        }
    }
    std::cout << "\n";
    return secret;
}

static void do_connect(BaseCLI& cli, const std::string& arg) {
    auto& service = cli.service();
    ConnectionConfig conn = service.preferred_connection();

    if (!arg.empty()) {
        auto target = parse_target(arg, conn);
        if (target.is_err()) {
            std::cout << theme::fail(target.error);
            std::cout << theme::step("Usage: connect [user@host[:port]]");
            return;
        }
        conn = target.value;
    }

    if (conn.user.empty()) {
        std::cout << theme::color::ORANGE << "    Username: " << theme::color::RESET << std::flush;
        std::getline(std::cin, conn.user);
        if (conn.user.empty()) {
            std::cout << theme::fail("Username cannot be empty.");
            return;
        }
    }

    auto& creds = CredentialManager::instance();
    bool prompted = false;
    auto stored = creds.get(conn.target());
    if (stored.is_ok()) {
        conn.secret = stored.value;
    } else {
        std::string label = conn.auth == AuthMethod::PrivateKey
            ? "    Key passphrase (blank for none): "
            : "    Password for " + conn.target() + ": ";
        conn.secret = read_secret(theme::color::ORANGE + label + theme::color::RESET);
        prompted = true;
        if (conn.secret.empty() && conn.auth == AuthMethod::Password) {
            std::cout << theme::fail("Password cannot be empty.");
            return;
        }
    }

    std::cout << theme::section("Connecting");
    std::cout << theme::kv("Target", fmt::format("{}:{}", conn.target(), conn.port));

    auto progress = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n" << std::flush;
    };

    auto result = service.connect(conn, progress);
    if (result.is_err()) {
        auto status = service.status();
        if (auto* f = std::get_if<Failed>(&status)) {
            std::cout << theme::fail(f->message);
            std::cout << theme::kv("Attempted", format_timestamp(f->last_attempt_at));
        } else {
            print_failure("Connect", result.error, result.kind);
        }
        if (stored.is_ok()) {
            std::cout << theme::step("Stored credentials may be stale: 'credentials remove "
                                     + conn.target() + "'");
        }
        return;
    }

    std::cout << theme::ok("Connected to " + conn.host);

    if (prompted && !conn.secret.empty()) {
        auto saved = creds.set(conn.target(), conn.secret);
        if (saved.is_err()) {
            socprint_log("credential store failed: " + saved.error);
            std::cout << theme::dim("    Could not remember the password: " + saved.error) << "\n";
        }
    }
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    auto& service = cli.service();
    if (std::holds_alternative<Disconnected>(service.status())) {
        std::cout << theme::info("Already disconnected.");
        return;
    }
    auto result = service.disconnect();
    if (result.is_err()) {
        print_failure("Disconnect", result.error, result.kind);
        return;
    }
    std::cout << theme::ok("Disconnected.");
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    auto& service = cli.service();
    auto status = service.status();
    auto conn = service.preferred_connection();

    std::cout << theme::section("Status");

    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::fail("Config not found");
    }
    std::cout << theme::kv("Target", fmt::format("{}:{}", conn.target(), conn.port));

    if (auto* c = std::get_if<Connected>(&status)) {
        std::cout << theme::kv("Session", theme::green("connected"));
        std::cout << theme::kv("Since", format_timestamp(c->connected_at)
                               + " (" + format_age(c->connected_at) + ")");
    } else if (auto* c = std::get_if<Connecting>(&status)) {
        std::cout << theme::kv("Session", theme::yellow("connecting"));
        std::cout << theme::kv("Elapsed", format_elapsed(c->elapsed_seconds));
    } else if (auto* f = std::get_if<Failed>(&status)) {
        std::cout << theme::kv("Session", theme::red("failed"));
        std::cout << theme::kv("Error", f->message);
        std::cout << theme::kv("Attempted", format_timestamp(f->last_attempt_at));
    } else {
        std::cout << theme::kv("Session", theme::dim("disconnected"));
    }

    int active = 0;
    for (const auto& job : service.list_jobs()) {
        if (!is_terminal(job.status)) active++;
    }
    std::cout << theme::kv("Active jobs", std::to_string(active));
    std::cout << theme::kv("Default", service.default_queue());
    std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Connect to the print server [user@host[:port]]");
    cli.add_command("disconnect", do_disconnect, "Close the SSH session");
    cli.add_command("status", do_status, "Show connection status");
}
