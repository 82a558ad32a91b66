#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
long long safe_stoll(const std::string& s, long long fallback = 0);

// Unique job identifier: "20260215-144410-637-3fa9c1".
std::string generate_job_id();

// Single-quote a string for a POSIX shell ('it'\''s').
std::string shell_quote(const std::string& s);

// Split text into lines, dropping '\r' and trailing empty lines.
std::vector<std::string> split_lines(const std::string& text);

// Split on runs of whitespace.
std::vector<std::string> split_words(const std::string& text);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
