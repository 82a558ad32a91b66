#include "session.hpp"
#include "auth.hpp"
#include <core/constants.hpp>
#include <managers/job_log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>
#include <mutex>

namespace {

// libssh2_init is process-wide and must run once.
bool init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] {
        platform::init_networking();
        rc = libssh2_init(0);
    });
    return rc == 0;
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback. Every prompt gets the password;
// a second round means the server rejected it.
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

} // namespace

SessionManager::SessionManager(const ConnectionConfig& config)
    : config_(config), session_(nullptr), channel_(nullptr),
      sock_(SOCPRINT_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    auto result = establish_connection(callback);
    socprint_log(fmt::format("SessionManager::establish {} -> {} {}",
                             config_.target(), result.exit_code, result.stderr_data));
    return result;
}

SSHResult SessionManager::fail(const std::string& reason, const std::string& message) {
    if (channel_) {
        libssh2_channel_close(channel_);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, reason.c_str());
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != SOCPRINT_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SOCPRINT_INVALID_SOCKET;
    }
    return SSHResult{-1, "", message};
}

SSHResult SessionManager::establish_connection(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", config_.host, config_.port));
    }

    if (!init_libssh2()) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    int timeout_ms = (config_.timeout > 0 ? config_.timeout : SSH_CONNECT_TIMEOUT_SECS) * 1000;
    auto sock = platform::connect_tcp(config_.host, config_.port, timeout_ms);
    if (sock.is_err()) {
        return SSHResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail("init", "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);
    libssh2_session_set_timeout(session_, timeout_ms);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        return fail("Handshake failed", "SSH handshake failed with " + config_.host);
    }

    platform::set_keepalive(sock_, 60, 15, 4);
    // SSH-level keepalive every 30s so idle NAT mappings survive
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        return fail("Authentication failed", auth_result.stderr_data);
    }

    auto shell_result = open_shell(callback);
    if (shell_result.failed()) {
        return fail("Shell not ready", shell_result.stderr_data);
    }

    active_ = true;
    target_str_ = config_.target();

    if (callback) {
        callback("Connected to " + config_.host);
    }
    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, config_.user.c_str(),
                                              static_cast<unsigned int>(config_.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return SSHResult{0, "", ""};
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(50);
    }

    std::string methods = auth_list ? auth_list : "";
    socprint_log("Auth methods offered: " + methods);

    if (config_.auth == AuthMethod::PrivateKey) {
        if (methods.find("publickey") == std::string::npos && !methods.empty()) {
            return SSHResult{-1, "", "Server does not accept public key authentication"};
        }
        if (callback) callback("Using key " + config_.key_path + "...");
        const char* passphrase = config_.secret.empty() ? nullptr : config_.secret.c_str();
        while ((ret = libssh2_userauth_publickey_fromfile_ex(
                    session_, config_.user.c_str(),
                    static_cast<unsigned int>(config_.user.length()),
                    nullptr, config_.key_path.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        return SSHResult{-1, "", "Key authentication failed (check key_path and passphrase)"};
    }

    if (methods.find("password") != std::string::npos || methods.empty()) {
        if (callback) callback("Using password auth...");
        while ((ret = libssh2_userauth_password(session_, config_.user.c_str(),
                                                config_.secret.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    // Some hosts only offer keyboard-interactive for plain passwords
    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd_data{config_.secret, 0};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                config_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check username/password)"};
}

SSHResult SessionManager::open_shell(StatusCallback callback) {
    int ret;
    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return SSHResult{-1, "", "Failed to open SSH channel"};
        }
        platform::sleep_ms(50);
    }

    while ((ret = libssh2_channel_request_pty_ex(
                channel_, "vt100", 5, nullptr, 0,
                SSH_PTY_COLS, SSH_PTY_ROWS, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        return SSHResult{-1, "", "Failed to request PTY"};
    }

    while ((ret = libssh2_channel_shell(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        return SSHResult{-1, "", "Failed to request shell"};
    }

    if (callback) callback("Waiting for shell...");

    ShellNegotiator negotiator;
    if (config_.auth == AuthMethod::Password && !config_.secret.empty()) {
        // Expired-password and pam banners may ask again inside the shell
        negotiator.set_password(config_.secret);
    }
    negotiator.set_timeout(std::chrono::seconds(SHELL_NEGOTIATE_SECS));
    return negotiator.negotiate(channel_, callback);
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (channel_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_close(channel_);
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_free(channel_);
        }
        channel_ = nullptr;
    }

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != SOCPRINT_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SOCPRINT_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ == SOCPRINT_INVALID_SOCKET) return false;

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    if (channel_ && libssh2_channel_eof(channel_)) {
        active_ = false;
        return false;
    }
    return true;
}
