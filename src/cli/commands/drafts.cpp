#include "../base_cli.hpp"
#include "../print_options.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>

static void do_draft(BaseCLI& cli, const std::string& arg) {
    auto& service = cli.service();
    auto args = split_args(arg);

    auto req = parse_print_options(args);
    if (req.is_err()) {
        std::cout << theme::fail(req.error);
        std::cout << theme::step("Usage: draft <file> [queue] [options]");
        return;
    }

    // Revising a draft layers the new options over what was saved.
    DraftJob draft;
    draft.source_path = req.value.file;
    draft.queue = req.value.queue;
    draft.settings = req.value.settings;
    if (auto existing = service.draft(req.value.file)) {
        auto layered = parse_print_options(args, existing->settings);
        if (layered.is_err()) {
            std::cout << theme::fail(layered.error);
            return;
        }
        draft.settings = layered.value.settings;
        if (draft.queue.empty()) draft.queue = existing->queue;
    }

    auto saved = service.save_draft(draft);
    std::cout << theme::ok("Draft saved for " + saved.source_path);
    std::cout << theme::kv("Queue", saved.queue.empty() ? "(default)" : saved.queue);
    std::cout << theme::kv("Settings", describe_settings(saved.settings));
}

static void do_drafts(BaseCLI& cli, const std::string& arg) {
    auto drafts = cli.service().drafts();
    if (drafts.empty()) {
        std::cout << theme::dim("    No drafts.") << "\n";
        return;
    }
    std::cout << "\n";
    for (const auto& d : drafts) {
        std::cout << "  " << theme::blue(d.source_path) << theme::dim("  saved "
                  + format_age(d.updated_at) + " ago") << "\n";
        std::cout << theme::dim(fmt::format("    {} on {}", describe_settings(d.settings),
                                            d.queue.empty() ? "default queue" : d.queue))
                  << "\n";
    }
    std::cout << "\n";
}

static void do_send(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: send <file>");
        return;
    }
    if (!cli.require_connection()) return;

    auto& service = cli.service();
    auto draft = service.draft(args[0]);
    if (!draft) {
        std::cout << theme::fail("No draft for " + args[0]);
        return;
    }
    std::string queue = draft->queue.empty() ? service.default_queue() : draft->queue;
    std::cout << theme::info(fmt::format("Printing {} on {}", draft->source_path, queue));
    report_submission(service.send_draft(args[0]));
}

static void do_discard(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: discard <file>");
        return;
    }
    if (cli.service().discard_draft(args[0])) {
        std::cout << theme::ok("Discarded draft for " + args[0]);
    } else {
        std::cout << theme::fail("No draft for " + args[0]);
    }
}

void register_drafts_commands(BaseCLI& cli) {
    cli.add_command("draft", do_draft, "Save print settings for later: draft <file> [queue] [options]");
    cli.add_command("drafts", do_drafts, "List saved drafts");
    cli.add_command("send", do_send, "Print a saved draft");
    cli.add_command("discard", do_discard, "Delete a saved draft");
}
