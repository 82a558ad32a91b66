#pragma once

#include <string>
#include <vector>
#include <regex>
#include <chrono>

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct Pattern {
    std::regex regex;
    std::string raw;

    explicit Pattern(const std::string& pattern)
        : regex(pattern, std::regex::ECMAScript), raw(pattern) {}
};

struct MatchResult {
    bool matched;
    size_t pattern_index;
    std::string matched_text;
    std::string before_text;
};

// Accumulates channel output until one of a set of patterns appears.
class ExpectMatcher {
public:
    ExpectMatcher() = default;

    // Returns matched=false on timeout or channel error; `closed()` tells
    // the two apart.
    MatchResult expect(LIBSSH2_CHANNEL* channel,
                       const std::vector<Pattern>& patterns,
                       std::chrono::milliseconds timeout);

    void clear_buffer() { buffer_.clear(); }
    const std::string& get_buffer() const { return buffer_; }
    bool closed() const { return closed_; }

    // Matches against text already read; exposed for tests.
    static bool check_patterns(const std::string& buffer,
                               const std::vector<Pattern>& patterns,
                               MatchResult& result);

private:
    std::string buffer_;
    bool closed_ = false;

    // Appends whatever is readable; false on EOF or channel error.
    bool read_available(LIBSSH2_CHANNEL* channel);
};
