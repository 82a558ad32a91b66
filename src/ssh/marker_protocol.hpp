#pragma once

#include <string>

// Sentinel protocol for commands sent through the interactive shell.
//
// Every command is wrapped as
//     echo __SOCPRINT_BEG''IN__ <token>; <cmd>; echo __SOCPRINT_DO''NE__ <token> $?
// The shell's own exit status decides success; the output text is never
// scanned for "error" words. The token ties a DONE line to the command that
// produced it, so late output from an earlier (timed-out) command cannot be
// mistaken for the current result.

struct MarkerResult {
    std::string output;
    int exit_code;
    bool found;
};

// Build a command string wrapped with BEGIN/DONE markers.
// Single-line commands keep DONE on the same line.
// Multi-line commands (heredocs) put DONE on a separate line.
std::string build_marker_command(const std::string& cmd, const std::string& token);

// Parse raw output for the BEGIN/DONE markers carrying `token`.
// Extracts text between markers, strips echo artifacts, parses exit code.
MarkerResult parse_marker_output(const std::string& raw, const std::string& token);

// Fresh token per command ("c17", "c18", ...).
std::string next_marker_token();

inline constexpr const char* SOCPRINT_BEGIN_MARKER = "__SOCPRINT_BEGIN__";
inline constexpr const char* SOCPRINT_DONE_MARKER  = "__SOCPRINT_DONE__";
