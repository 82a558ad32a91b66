#include "expect.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <thread>

MatchResult ExpectMatcher::expect(LIBSSH2_CHANNEL* channel,
                                  const std::vector<Pattern>& patterns,
                                  std::chrono::milliseconds timeout) {
    MatchResult result{false, 0, "", ""};
    if (!channel) {
        closed_ = true;
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (check_patterns(buffer_, patterns, result)) {
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.before_text = buffer_;
            return result;
        }
        if (!read_available(channel)) {
            closed_ = true;
            result.before_text = buffer_;
            // One last look: the final chunk may hold the match
            check_patterns(buffer_, patterns, result);
            return result;
        }
    }
}

bool ExpectMatcher::read_available(LIBSSH2_CHANNEL* channel) {
    char buf[SSH_READ_BUF_SIZE];
    ssize_t n = libssh2_channel_read(channel, buf, sizeof(buf));
    bool eof = n <= 0 && n != LIBSSH2_ERROR_EAGAIN && libssh2_channel_eof(channel);

    if (n > 0) {
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n == LIBSSH2_ERROR_EAGAIN || (n == 0 && !eof)) {
        // libssh2 owns the socket; short sleeps instead of select
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return true;
    }
    return false;
}

bool ExpectMatcher::check_patterns(const std::string& buffer,
                                   const std::vector<Pattern>& patterns,
                                   MatchResult& result) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        std::smatch match;
        if (std::regex_search(buffer, match, patterns[i].regex)) {
            result.matched = true;
            result.pattern_index = i;
            result.matched_text = match[0];
            result.before_text = buffer.substr(0, static_cast<size_t>(match.position()));
            return true;
        }
    }
    return false;
}
