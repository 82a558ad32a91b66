#pragma once

#include <memory>
#include "remote_session.hpp"

// RemoteSession backed by libssh2: SessionManager for the login,
// SSHConnection for commands and uploads.
Result<std::shared_ptr<RemoteSession>> open_ssh_session(const ConnectionConfig& config,
                                                        StatusCallback callback);
