#include "platform.hpp"
#include <chrono>
#include <cstdlib>
#include <thread>

#ifndef _WIN32
#  include <pwd.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

static const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

fs::path home_dir() {
#ifdef _WIN32
    if (const char* p = env_or_null("USERPROFILE")) return fs::path(p);
#endif
    if (const char* p = env_or_null("HOME")) return fs::path(p);
#ifndef _WIN32
    // Services and cron jobs may run without HOME
    if (struct passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir && *pw->pw_dir) return fs::path(pw->pw_dir);
    }
#endif
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : p;
}

fs::path app_dir() {
    if (const char* p = env_or_null("SOCPRINT_HOME")) return fs::path(p);
    return home_dir() / ".socprint";
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
