#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/credentials.hpp>
#include <core/utils.hpp>

// credentials            list targets with a stored secret
// credentials remove X   forget the secret for X
static void do_credentials(BaseCLI& cli, const std::string& arg) {
    auto& creds = CredentialManager::instance();
    auto args = split_words(arg);

    if (args.empty() || args[0] == "list") {
        auto targets = creds.list();
        if (targets.empty()) {
            std::cout << theme::dim("    No stored credentials.") << "\n";
            return;
        }
        for (const auto& t : targets) {
            std::cout << theme::kv("Stored", t);
        }
        return;
    }

    if (args[0] == "remove" && args.size() == 2) {
        auto result = creds.remove(args[1]);
        if (result.is_err()) {
            std::cout << theme::fail(result.error);
            return;
        }
        std::cout << theme::ok("Forgot the secret for " + args[1]);
        return;
    }

    std::cout << theme::fail("Usage: credentials [list | remove <user@host>]");
}

void register_credentials_commands(BaseCLI& cli) {
    cli.add_command("credentials", do_credentials, "List or forget stored passwords");
}
