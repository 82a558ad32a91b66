#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <core/types.hpp>
#include "expect.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// What kind of challenge did we see?
enum class ChallengeType {
    SHELL_READY,   // A shell prompt
    PASSWORD,      // Server wants a password
};

// A pattern tagged with its meaning
struct Challenge {
    Pattern pattern;
    ChallengeType type;
};

// Drives a freshly opened PTY shell to a quiet, marker-ready state:
// answers an in-shell password prompt if one appears, waits for the first
// prompt, then disables echo and the prompt and confirms with a marker
// round-trip.
class ShellNegotiator {
public:
    ShellNegotiator() = default;

    void set_password(const std::string& password);
    void set_timeout(std::chrono::seconds timeout);

    SSHResult negotiate(LIBSSH2_CHANNEL* channel, StatusCallback callback = nullptr);

    // Command sent once the prompt is seen. Leaves the shell with no
    // prompt, no echo and the C locale so lpr/lpq text is stable.
    static std::string quiet_shell_command();

private:
    std::string password_;
    bool handle_password_ = false;
    std::chrono::seconds timeout_{30};

    std::vector<Challenge> build_challenges() const;
    static bool write_channel(LIBSSH2_CHANNEL* channel, const std::string& data);
};
