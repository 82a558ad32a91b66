#include "print_options.hpp"
#include <fmt/format.h>
#include <core/utils.hpp>

namespace {

bool parse_int_arg(const std::string& text, int& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    out = safe_stoi(text, -1);
    return out >= 0;
}

} // namespace

Result<PrintRequest> parse_print_options(const std::vector<std::string>& args,
                                         const PrintSettings& base) {
    PrintRequest req;
    req.settings = base;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        auto value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= args.size()) {
                return Result<std::string>::Err(ErrorKind::Config, flag + " needs a value");
            }
            return Result<std::string>::Ok(args[++i]);
        };

        if (a == "-n" || a == "--copies") {
            auto v = value(a);
            if (v.is_err()) return Result<PrintRequest>::Err(v.kind, v.error);
            int n = 0;
            if (!parse_int_arg(v.value, n)) {
                return Result<PrintRequest>::Err(ErrorKind::Config, "Invalid copy count: " + v.value);
            }
            req.settings.copies = n;
        } else if (a == "--duplex") {
            auto v = value(a);
            if (v.is_err()) return Result<PrintRequest>::Err(v.kind, v.error);
            auto mode = parse_duplex(v.value);
            if (!mode) {
                return Result<PrintRequest>::Err(ErrorKind::Config,
                    "Unknown duplex mode: " + v.value + " (none, long, short)");
            }
            req.settings.duplex = *mode;
        } else if (a == "--paper") {
            auto v = value(a);
            if (v.is_err()) return Result<PrintRequest>::Err(v.kind, v.error);
            auto paper = parse_paper(v.value);
            if (!paper) {
                return Result<PrintRequest>::Err(ErrorKind::Config,
                    "Unknown paper size: " + v.value + " (A4, A3)");
            }
            req.settings.paper = *paper;
        } else if (a == "--landscape") {
            req.settings.orientation = Orientation::Landscape;
        } else if (a == "--portrait") {
            req.settings.orientation = Orientation::Portrait;
        } else if (a == "--nup") {
            auto v = value(a);
            if (v.is_err()) return Result<PrintRequest>::Err(v.kind, v.error);
            int n = 0;
            if (!parse_int_arg(v.value, n)) {
                return Result<PrintRequest>::Err(ErrorKind::Config, "Invalid pages per sheet: " + v.value);
            }
            req.settings.pages_per_sheet = n;
        } else if (a == "--pages") {
            auto v = value(a);
            if (v.is_err()) return Result<PrintRequest>::Err(v.kind, v.error);
            auto range = parse_page_range(v.value);
            if (range.is_err()) return Result<PrintRequest>::Err(ErrorKind::Config, range.error);
            req.settings.page_range = range.value;
        } else if (a.size() > 1 && a[0] == '-') {
            return Result<PrintRequest>::Err(ErrorKind::Config, "Unknown option: " + a);
        } else {
            positional.push_back(a);
        }
    }

    if (positional.empty()) {
        return Result<PrintRequest>::Err(ErrorKind::Config, "Missing file");
    }
    if (positional.size() > 2) {
        return Result<PrintRequest>::Err(ErrorKind::Config,
            "Unexpected argument: " + positional[2]);
    }
    req.file = positional[0];
    if (positional.size() == 2) req.queue = positional[1];

    auto valid = validate(req.settings);
    if (valid.is_err()) return Result<PrintRequest>::Err(ErrorKind::Config, valid.error);
    return Result<PrintRequest>::Ok(std::move(req));
}

std::string describe_settings(const PrintSettings& s) {
    std::string out = s.copies == 1 ? "1 copy" : fmt::format("{} copies", s.copies);
    switch (s.duplex) {
        case DuplexMode::Simplex:   out += ", one-sided"; break;
        case DuplexMode::LongEdge:  out += ", long-edge duplex"; break;
        case DuplexMode::ShortEdge: out += ", short-edge duplex"; break;
    }
    out += fmt::format(", {} {}", paper_name(s.paper), orientation_name(s.orientation));
    if (s.pages_per_sheet > 1) out += fmt::format(", {}-up", s.pages_per_sheet);
    if (s.page_range.kind != PageRange::Kind::All) {
        out += ", pages " + s.page_range.to_string();
    }
    return out;
}
