#include "utils.hpp"
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long safe_stoll(const std::string& s, long long fallback) {
    try {
        return std::stoll(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string generate_job_id() {
    static std::mutex rng_mutex;
    static std::mt19937 rng(std::random_device{}());
    static std::atomic<unsigned> counter{0};

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y%m%d-%H%M%S", &tm_buf);

    unsigned suffix;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        suffix = rng() & 0xFFFFF;
    }
    // Counter nibble keeps ids from the same millisecond apart
    unsigned seq = counter.fetch_add(1) & 0xF;
    return fmt::format("{}-{:03d}-{:05x}{:x}", ts, static_cast<int>(ms.count()), suffix, seq);
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    while (!lines.empty()) {
        std::string last = lines.back();
        trim(last);
        if (!last.empty()) break;
        lines.pop_back();
    }
    return lines;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}
