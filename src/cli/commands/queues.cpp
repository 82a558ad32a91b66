#include "../base_cli.hpp"
#include "../theme.hpp"
#include <algorithm>
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>
#include <platform/terminal.hpp>

static void print_snapshot(const QueueSnapshot& snap, bool full) {
    std::cout << theme::section(snap.queue);
    if (snap.error) {
        std::cout << theme::fail(*snap.error);
        std::cout << theme::kv("Checked", format_timestamp(snap.refreshed_at));
        return;
    }
    std::cout << theme::kv("Refreshed", format_timestamp(snap.refreshed_at)
                           + " (" + format_age(snap.refreshed_at) + " ago)");

    size_t limit = full ? snap.lines.size() : std::min<size_t>(snap.lines.size(), 8);
    size_t width = static_cast<size_t>(std::max(platform::term_width() - 4, 20));
    for (size_t i = 0; i < limit; ++i) {
        const auto& line = snap.lines[i];
        std::cout << "    " << (full || line.size() <= width ? line : line.substr(0, width)) << "\n";
    }
    if (limit < snap.lines.size()) {
        std::cout << theme::dim(fmt::format("    ... {} more lines ('queues {}')",
                                            snap.lines.size() - limit, snap.queue)) << "\n";
    }
}

static void do_queues(BaseCLI& cli, const std::string& arg) {
    auto& service = cli.service();

    if (!arg.empty()) {
        const auto& queues = service.queues();
        if (std::find(queues.begin(), queues.end(), arg) == queues.end()) {
            std::cout << theme::fail("Not a polled queue: " + arg);
            return;
        }
        auto snap = service.queue_snapshot(arg);
        if (!snap) {
            std::cout << theme::dim("    No listing for " + arg + " yet.") << "\n";
            return;
        }
        print_snapshot(*snap, true);
        std::cout << "\n";
        return;
    }

    std::string def = service.default_queue();
    for (const auto& q : service.queues()) {
        auto snap = service.queue_snapshot(q);
        if (snap) {
            print_snapshot(*snap, false);
        } else {
            std::cout << theme::section(q);
            std::cout << theme::dim("    No listing yet.") << "\n";
        }
        if (q == def) std::cout << theme::dim("    (default queue)") << "\n";
    }
    if (!service.is_connected()) {
        std::cout << "\n" << theme::step("Listings refresh while connected.");
    }
    std::cout << "\n";
}

static void do_refresh(BaseCLI& cli, const std::string& arg) {
    auto result = cli.service().refresh();
    if (result.is_err()) {
        print_failure("Refresh", result.error, result.kind);
        return;
    }
    if (result.value) {
        std::cout << theme::ok("Queues refreshed.");
    } else {
        std::cout << theme::info("A refresh is already running.");
    }
}

static void do_default(BaseCLI& cli, const std::string& arg) {
    auto& service = cli.service();
    if (arg.empty()) {
        std::cout << theme::kv("Default", service.default_queue());
        return;
    }
    const auto& queues = service.queues();
    if (std::find(queues.begin(), queues.end(), arg) == queues.end()) {
        std::cout << theme::info(arg + " is not polled; jobs on it are tracked only until lpr.");
    }
    auto result = service.set_default_queue(arg);
    if (result.is_err()) {
        print_failure("Saving preference", result.error, result.kind);
        return;
    }
    std::cout << theme::ok("Default queue is now " + arg);
}

void register_queues_commands(BaseCLI& cli) {
    cli.add_command("queues", do_queues, "Show queue listings [name]");
    cli.add_command("refresh", do_refresh, "Poll every queue now");
    cli.add_command("default", do_default, "Show or set the default queue");
}
