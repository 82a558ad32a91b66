#include "credentials.hpp"
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

// Credentials stored as key=value lines in ~/.socprint/credentials
// File is chmod 600.

CredentialManager& CredentialManager::instance() {
    static CredentialManager mgr;
    return mgr;
}

CredentialManager::CredentialManager()
    : path_((platform::app_dir() / "credentials").string()) {
}

std::map<std::string, std::string> CredentialManager::read_all() const {
    std::map<std::string, std::string> m;
    std::ifstream f(path_);
    if (!f) return m;

    std::string line;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

bool CredentialManager::write_all(const std::map<std::string, std::string>& m) const {
    fs::path path(path_);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    std::ofstream f(path, std::ios::trunc);
    if (!f) return false;

    for (const auto& [k, v] : m) {
        f << k << "=" << v << "\n";
    }
    f.close();

    chmod(path.c_str(), 0600);
    return true;
}

Result<std::string> CredentialManager::get(const std::string& target) {
    auto m = read_all();
    auto it = m.find(target);
    if (it == m.end()) {
        return Result<std::string>::Err(ErrorKind::NotFound, "No stored secret for " + target);
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> CredentialManager::set(const std::string& target, const std::string& secret) {
    if (target.find('=') != std::string::npos || secret.find('\n') != std::string::npos) {
        return Result<void>::Err(ErrorKind::Storage, "Target or secret contains a reserved character");
    }
    auto m = read_all();
    m[target] = secret;
    if (!write_all(m)) {
        return Result<void>::Err(ErrorKind::Storage, "Failed to write credentials file");
    }
    return Result<void>::Ok();
}

Result<void> CredentialManager::remove(const std::string& target) {
    auto m = read_all();
    if (m.erase(target) == 0) {
        return Result<void>::Err(ErrorKind::NotFound, "No stored secret for " + target);
    }
    if (!write_all(m)) {
        return Result<void>::Err(ErrorKind::Storage, "Failed to write credentials file");
    }
    return Result<void>::Ok();
}

std::vector<std::string> CredentialManager::list() {
    std::vector<std::string> targets;
    for (const auto& [k, v] : read_all()) {
        targets.push_back(k);
    }
    return targets;
}
