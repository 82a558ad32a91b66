#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string socprint_log_path() {
    static std::string path = (platform::temp_dir() / "socprint_debug.log").string();
    return path;
}

// Persistent job log path: ~/.socprint/logs/{job_id}.log
inline std::string job_log_path(const std::string& job_id) {
    return (platform::app_dir() / "logs" / (job_id + ".log")).string();
}

inline std::mutex& socprint_log_mutex() {
    static std::mutex m;
    return m;
}

// Append a timestamped line to a job's persistent log file.
inline void append_job_log(const std::string& job_id, const std::string& msg) {
    std::string path = job_log_path(job_id);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::lock_guard<std::mutex> lock(socprint_log_mutex());
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void socprint_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(socprint_log_mutex());
    std::ofstream out(socprint_log_path(), std::ios::app);
    if (out) out << line;
}

inline void socprint_log_ssh(const std::string& cmd, int exit_code, const std::string& output) {
    socprint_log(fmt::format("CMD: {}", cmd));
    socprint_log(fmt::format("exit={} out({})={}", exit_code, output.size(), output.substr(0, 500)));
}
