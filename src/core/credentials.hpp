#pragma once

#include <string>
#include <vector>
#include <map>
#include "types.hpp"

// Secrets (SSH password or key passphrase) keyed by "user@host".
// Kept apart from config.yaml and state.yaml so neither ever holds a secret.
class CredentialManager {
public:
    static CredentialManager& instance();

    // Use a different backing file (tests point this at a temp dir)
    Result<std::string> get(const std::string& target);
    Result<void> set(const std::string& target, const std::string& secret);
    Result<void> remove(const std::string& target);

    // Targets that have a stored secret
    std::vector<std::string> list();

private:
    CredentialManager();

    std::string path_;

    std::map<std::string, std::string> read_all() const;
    bool write_all(const std::map<std::string, std::string>& m) const;
};
