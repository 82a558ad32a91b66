#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "cli/print_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <managers/job_log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <ssh/ssh_remote_session.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    socprint"
              << theme::color::RESET << theme::color::DIM
              << "                         Interactive prompt" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    socprint "
              << theme::color::RESET << theme::color::ORANGE << "user@host[:port]"
              << theme::color::RESET << theme::color::DIM
              << "        Connect, then prompt" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    socprint "
              << theme::color::RESET << theme::color::ORANGE << "<command> [args]"
              << theme::color::RESET << theme::color::DIM
              << "        Run one command (see 'help')" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    socprint --config <file>  Use another config file\n"
              << "    socprint --version        Show version\n"
              << "    socprint --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        std::string config_path;

        if (!args.empty() && args[0] == "--version") {
            std::cout << theme::color::ORANGE << theme::color::BOLD << "socprint"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SOCPRINT_VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (!args.empty() && args[0] == "--help") {
            print_usage();
            return 0;
        }
        if (args.size() >= 2 && args[0] == "--config") {
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        auto config = config_path.empty() ? Config::load_global() : Config::load_file(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            std::cout << theme::step("Fix " + (config_path.empty()
                                         ? get_global_config_path().string() : config_path));
            return 1;
        }

        platform::init_networking();

        auto service = std::make_unique<PrintService>(config.value, open_ssh_session,
                                                      platform::app_dir());
        auto loaded = service->init();
        if (loaded.is_err()) {
            std::cout << theme::fail("Could not load saved jobs: " + loaded.error);
            std::cout << theme::step("Starting with an empty history.");
        }

        PrintCLI cli(std::move(service));

        if (args.empty()) {
            cli.run_repl();
            return 0;
        }

        // user@host[:port]: connect, then the interactive prompt
        if (args.size() == 1 && args[0].find('@') != std::string::npos) {
            cli.execute_command("connect", args[0]);
            cli.run_repl();
            return 0;
        }

        std::string command = args[0];
        std::string rest;
        for (size_t i = 1; i < args.size(); ++i) {
            if (i > 1) rest += " ";
            // Keep paths with spaces together for split_args
            rest += args[i].find(' ') != std::string::npos ? "\"" + args[i] + "\"" : args[i];
        }

        static const std::set<std::string> needs_session = {"print", "send", "refresh", "cancel"};
        if (needs_session.count(command)) {
            cli.run_command("connect", "");
            if (!cli.service().is_connected()) return 1;
        }
        cli.run_command(command, rest);
        return 0;
    } catch (const std::exception& e) {
        socprint_log(std::string("fatal: ") + e.what());
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
