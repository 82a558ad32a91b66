#pragma once

#include <string>
#include <vector>
#include <core/print_settings.hpp>
#include <core/types.hpp>

// Arguments of `print` and `draft`: a file, an optional queue, and options
// layered over `base` (the defaults, or an existing draft's settings).
struct PrintRequest {
    std::string file;
    std::string queue;          // empty when not given
    PrintSettings settings;
};

Result<PrintRequest> parse_print_options(const std::vector<std::string>& args,
                                         const PrintSettings& base = PrintSettings{});

// One-line summary: "2 copies, long-edge duplex, A4 portrait, 2-up, pages 1-3"
std::string describe_settings(const PrintSettings& settings);
