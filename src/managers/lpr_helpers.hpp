#pragma once

#include <optional>
#include <string>
#include <vector>

// One job row of `lpq -P <queue>`:
//   Rank    Owner   Job     File(s)                         Total Size
//   active  alice   123     report.pdf                      1024 bytes
struct LpqEntry {
    std::string rank;       // "active", "1st", "2nd", ...
    std::string owner;
    int job_number = 0;
    std::string file;       // may contain spaces
    long long size_bytes = 0;

    bool is_active() const { return rank == "active"; }
};

// Parse lpr's "request id is psts-123 (1 file(s))" -> "psts-123".
std::optional<std::string> parse_lpr_request_id(const std::string& output);

// Numeric job number of a remote id: "psts-123" -> 123, "123" -> 123.
std::optional<int> remote_job_number(const std::string& remote_id);

// Job rows of an lpq listing. Status and header lines ("psts is ready",
// "Rank Owner ...", "no entries") are skipped.
std::vector<LpqEntry> parse_lpq_output(const std::vector<std::string>& lines);

// Row for a remote id, or nullptr.
const LpqEntry* find_lpq_entry(const std::vector<LpqEntry>& entries, const std::string& remote_id);

std::string lpq_command(const std::string& queue);
std::string lprm_command(const std::string& queue, const std::string& remote_id);
