#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "none";
        case ErrorKind::Connection:        return "connection";
        case ErrorKind::AlreadyConnecting: return "already-connecting";
        case ErrorKind::NotConnected:      return "not-connected";
        case ErrorKind::RemoteCommand:     return "remote-command";
        case ErrorKind::Staging:           return "staging";
        case ErrorKind::InvalidTransition: return "invalid-transition";
        case ErrorKind::NotFound:          return "not-found";
        case ErrorKind::Config:            return "config";
        case ErrorKind::Storage:           return "storage";
    }
    return "unknown";
}

const char* auth_method_name(AuthMethod method) {
    return method == AuthMethod::PrivateKey ? "key" : "password";
}

std::optional<AuthMethod> parse_auth_method(const std::string& name) {
    if (name == "password") return AuthMethod::Password;
    if (name == "key" || name == "publickey" || name == "private-key") return AuthMethod::PrivateKey;
    return std::nullopt;
}
