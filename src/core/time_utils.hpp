#pragma once

#include <string>

// Format the age of an ISO timestamp (YYYY-MM-DDTHH:MM:SS) relative to `now_time`
// (or the current time when empty). Returns "2h35m", "14m22s", "8s",
// "3d4h" for multi-day spans, or "-" if start is empty.
std::string format_age(const std::string& start_time, const std::string& now_time = "");

// Format an ISO timestamp to "8:13pm" display.
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);

// Format a Connecting{elapsed} counter: "7s", "1m05s".
std::string format_elapsed(int seconds);

// True if the ISO timestamp lies more than `days` days before now.
bool older_than_days(const std::string& iso_time, int days);
