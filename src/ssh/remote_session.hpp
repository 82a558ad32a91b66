#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// One authenticated remote shell. The only capabilities are running a text
// command and staging a local file on the remote side. Not thread-safe:
// callers go through CommandSerializer.
//
// SSHResult conventions: exit_code >= 0 is the remote command's own exit
// status; exit_code < 0 is a transport failure with the reason in
// stderr_data.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual SSHResult run(const std::string& command, int timeout_secs = 0) = 0;
    virtual SSHResult upload(const fs::path& local, const std::string& remote) = 0;
    virtual bool is_active() const = 0;
    virtual void close() = 0;

    // "user@host", for logs and status lines.
    virtual std::string describe() const = 0;
};

// Opens a RemoteSession for a config. Injected into SessionLifecycle so
// tests can substitute a scripted session.
using SessionOpener = std::function<Result<std::shared_ptr<RemoteSession>>(
    const ConnectionConfig&, StatusCallback)>;
