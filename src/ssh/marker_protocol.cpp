#include "marker_protocol.hpp"
#include <core/utils.hpp>
#include <atomic>

std::string build_marker_command(const std::string& cmd, const std::string& token) {
    // BEG''IN / DO''NE keep the literal marker out of the PTY echo; the
    // echo builtin still prints the joined string.
    std::string begin = "echo __SOCPRINT_BEG''IN__ " + token + "; ";
    std::string done = "echo __SOCPRINT_DO''NE__ " + token + " $?\n";
    if (cmd.find('\n') == std::string::npos) {
        return begin + cmd + "; " + done;
    }
    // Heredoc terminators must stay alone on their line.
    return begin + cmd + "\n" + done;
}

std::string next_marker_token() {
    static std::atomic<unsigned long> counter{0};
    return "c" + std::to_string(++counter);
}

MarkerResult parse_marker_output(const std::string& raw, const std::string& token) {
    const std::string done_marker = std::string(SOCPRINT_DONE_MARKER) + " " + token + " ";
    const std::string begin_marker = std::string(SOCPRINT_BEGIN_MARKER) + " " + token;

    auto done_pos = raw.find(done_marker);
    if (done_pos == std::string::npos) {
        return {"", 0, false};
    }

    // Exit code must be followed by a line break; otherwise the digits may
    // still be arriving.
    auto code_start = done_pos + done_marker.length();
    auto code_end = raw.find_first_not_of("0123456789", code_start);
    if (code_end == std::string::npos || code_end == code_start) {
        return {"", 0, false};
    }
    int exit_code = safe_stoi(raw.substr(code_start, code_end - code_start), 1);

    // Extract text between BEGIN and DONE markers
    std::string clean;
    auto begin_pos = raw.rfind(begin_marker, done_pos);
    if (begin_pos != std::string::npos) {
        auto content_start = begin_pos + begin_marker.length();
        if (content_start < raw.length() && raw[content_start] == '\r')
            content_start++;
        if (content_start < raw.length() && raw[content_start] == '\n')
            content_start++;
        clean = raw.substr(content_start, done_pos - content_start);
    } else {
        clean = raw.substr(0, done_pos);
    }

    // Strip a trailing echo of the sentinel command (shells without stty -echo)
    auto clean_end = clean.find_last_not_of("\r\n");
    clean.erase(clean_end == std::string::npos ? 0 : clean_end + 1);
    auto last_nl = clean.find_last_of('\n');
    std::string trailing = last_nl == std::string::npos ? clean : clean.substr(last_nl + 1);
    if (trailing.find("__SOCPRINT_DO") != std::string::npos) {
        clean = last_nl == std::string::npos ? "" : clean.substr(0, last_nl);
    }

    // Normalize CRLF from the PTY
    std::string out;
    out.reserve(clean.size());
    for (char c : clean) {
        if (c != '\r') out += c;
    }

    auto last_content = out.find_last_not_of(" \t\n");
    if (last_content == std::string::npos) {
        out.clear();
    } else {
        out.erase(last_content + 1);
    }

    return {out, exit_code, true};
}
