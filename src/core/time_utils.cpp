#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <ctime>
#include <sstream>
#include <iomanip>

// ISO timestamp parsing (YYYY-MM-DDTHH:MM:SS)
static bool parse_iso(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

std::string format_age(const std::string& start_time, const std::string& now_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm = {};
    if (!parse_iso(start_time, &start_tm)) {
        return "?";
    }
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t;
    if (!now_time.empty()) {
        struct tm end_tm = {};
        if (!parse_iso(now_time, &end_tm)) {
            return "?";
        }
        end_t = mktime(&end_tm);
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, start_t));
    if (seconds < 0) seconds = 0;
    int days = seconds / 86400;
    int hours = (seconds % 86400) / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (days > 0) {
        return fmt::format("{}d{}h", days, hours);
    } else if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time, &tm_buf)) {
        return "?";
    }

    // "08:13PM" -> "8:13pm"
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string format_elapsed(int seconds) {
    if (seconds < 0) seconds = 0;
    if (seconds < 60) return fmt::format("{}s", seconds);
    return fmt::format("{}m{:02d}s", seconds / 60, seconds % 60);
}

bool older_than_days(const std::string& iso_time, int days) {
    struct tm tm_buf = {};
    if (!parse_iso(iso_time, &tm_buf)) return false;
    std::time_t then = mktime(&tm_buf);
    return std::difftime(std::time(nullptr), then) > static_cast<double>(days) * 86400.0;
}
