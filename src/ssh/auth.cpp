#include "auth.hpp"
#include "marker_protocol.hpp"
#include <platform/platform.hpp>
#include <libssh2.h>

// ── Built-in patterns ────────────────────────────────────────────────

static const std::vector<Challenge>& builtin_shell_prompts() {
    static const std::vector<Challenge> prompts{
        {Pattern("\\[[^\\]]+@[^\\]]+\\][$#] ?$"), ChallengeType::SHELL_READY},
        {Pattern("[^\\s]+@[^\\s]+:[^\\n]*[$#] ?$"), ChallengeType::SHELL_READY},
        {Pattern("[$#>] ?$"),                       ChallengeType::SHELL_READY},
    };
    return prompts;
}

static const std::vector<Challenge>& builtin_password_prompts() {
    static const std::vector<Challenge> prompts{
        {Pattern("[Pp]assword[^\\n]*: ?$"), ChallengeType::PASSWORD},
    };
    return prompts;
}

// ── ShellNegotiator ──────────────────────────────────────────────────

void ShellNegotiator::set_password(const std::string& password) {
    password_ = password;
    handle_password_ = true;
}

void ShellNegotiator::set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
}

std::string ShellNegotiator::quiet_shell_command() {
    return "stty -echo 2>/dev/null; unset PROMPT_COMMAND; PS1=''; PS2=''; "
           "export LC_ALL=C LANG=C";
}

std::vector<Challenge> ShellNegotiator::build_challenges() const {
    std::vector<Challenge> challenges;

    // Password before shell: "Password: " also ends in a prompt-like char
    if (handle_password_) {
        const auto& pw = builtin_password_prompts();
        challenges.insert(challenges.end(), pw.begin(), pw.end());
    }

    const auto& shell = builtin_shell_prompts();
    challenges.insert(challenges.end(), shell.begin(), shell.end());
    return challenges;
}

bool ShellNegotiator::write_channel(LIBSSH2_CHANNEL* channel, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = libssh2_channel_write(channel, data.c_str() + written,
                                          data.size() - written);
        if (n == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(10);
            continue;
        }
        if (n < 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

SSHResult ShellNegotiator::negotiate(LIBSSH2_CHANNEL* channel, StatusCallback callback) {
    if (!channel) {
        return SSHResult{-1, "", "No channel"};
    }

    auto challenges = build_challenges();
    std::vector<Pattern> patterns;
    std::vector<ChallengeType> tags;
    for (auto& c : challenges) {
        patterns.push_back(c.pattern);
        tags.push_back(c.type);
    }

    ExpectMatcher matcher;
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    bool password_sent = false;
    bool prompt_seen = false;

    while (!prompt_seen) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return SSHResult{-1, "", "Shell negotiation timed out"};
        }

        auto result = matcher.expect(channel, patterns, remaining);
        if (!result.matched) {
            if (matcher.closed()) {
                return SSHResult{-1, "", "Shell closed during login"};
            }
            std::string buf = matcher.get_buffer();
            if (buf.empty()) {
                return SSHResult{-1, "", "Shell prompt not detected (no output received)"};
            }
            return SSHResult{-1, "", "Shell prompt not detected: " + buf.substr(0, 200)};
        }

        switch (tags[result.pattern_index]) {
        case ChallengeType::SHELL_READY:
            prompt_seen = true;
            break;

        case ChallengeType::PASSWORD:
            if (password_sent) {
                return SSHResult{-1, "", "Password rejected (prompted again after sending)"};
            }
            if (callback) callback("Sending password...");
            if (!write_channel(channel, password_ + "\n")) {
                return SSHResult{-1, "", "Failed to send password"};
            }
            password_sent = true;
            matcher.clear_buffer();
            break;
        }
    }

    // Silence the shell and prove the marker protocol works end to end
    const std::string token = "init";
    matcher.clear_buffer();
    if (!write_channel(channel, build_marker_command(quiet_shell_command(), token))) {
        return SSHResult{-1, "", "Failed to configure shell"};
    }

    std::vector<Pattern> done{Pattern(std::string(SOCPRINT_DONE_MARKER) + " " + token + " [0-9]+\\r?\\n")};
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) remaining = std::chrono::milliseconds(1000);
    auto ready = matcher.expect(channel, done, remaining);
    if (!ready.matched) {
        return SSHResult{-1, "", "Shell did not answer the readiness probe"};
    }
    return SSHResult{0, "", ""};
}
