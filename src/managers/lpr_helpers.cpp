#include "lpr_helpers.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::optional<std::string> parse_lpr_request_id(const std::string& output) {
    static const std::string needle = "request id is ";
    auto start = output.find(needle);
    if (start == std::string::npos) return std::nullopt;

    std::string rest = output.substr(start + needle.size());
    auto end = rest.find_first_of(" \r\n(");
    std::string id = rest.substr(0, end);
    trim(id);
    if (id.empty()) return std::nullopt;
    return id;
}

std::optional<int> remote_job_number(const std::string& remote_id) {
    auto dash = remote_id.rfind('-');
    std::string digits = dash == std::string::npos ? remote_id : remote_id.substr(dash + 1);
    if (!all_digits(digits)) return std::nullopt;
    int n = safe_stoi(digits, -1);
    if (n < 0) return std::nullopt;
    return n;
}

std::vector<LpqEntry> parse_lpq_output(const std::vector<std::string>& lines) {
    std::vector<LpqEntry> entries;
    for (const auto& line : lines) {
        auto words = split_words(line);
        // rank owner job file... size "bytes"
        if (words.size() < 5 || !all_digits(words[2])) continue;

        LpqEntry e;
        e.rank = words[0];
        e.owner = words[1];
        e.job_number = safe_stoi(words[2], 0);

        size_t file_end = words.size();
        if (words.back() == "bytes" && words.size() >= 6 && all_digits(words[words.size() - 2])) {
            e.size_bytes = safe_stoll(words[words.size() - 2], 0);
            file_end = words.size() - 2;
        }
        for (size_t i = 3; i < file_end; ++i) {
            if (!e.file.empty()) e.file += " ";
            e.file += words[i];
        }
        entries.push_back(e);
    }
    return entries;
}

const LpqEntry* find_lpq_entry(const std::vector<LpqEntry>& entries, const std::string& remote_id) {
    auto number = remote_job_number(remote_id);
    if (!number) return nullptr;
    for (const auto& e : entries) {
        if (e.job_number == *number) return &e;
    }
    return nullptr;
}

std::string lpq_command(const std::string& queue) {
    return fmt::format(LPQ_CMD, shell_quote(queue));
}

std::string lprm_command(const std::string& queue, const std::string& remote_id) {
    auto number = remote_job_number(remote_id);
    return fmt::format(LPRM_CMD, shell_quote(queue),
                       number ? std::to_string(*number) : shell_quote(remote_id));
}
