#pragma once

#include <string>
#include <filesystem>

namespace platform {

// HOME (USERPROFILE on Windows), else the passwd entry, else temp_dir().
std::filesystem::path home_dir();

// System temp directory; /tmp when it cannot be determined.
std::filesystem::path temp_dir();

// ~/.socprint, or $SOCPRINT_HOME when set.
std::filesystem::path app_dir();

void sleep_ms(int ms);

} // namespace platform
