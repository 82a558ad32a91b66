#include "print_settings.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>

static const int VALID_NUP[] = {1, 2, 4, 6, 9, 16};

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string PageRange::to_string() const {
    switch (kind) {
        case Kind::All: return "";
        case Kind::Range: return fmt::format("{}-{}", start, end);
        case Kind::Selection: return fmt::format("{}", fmt::join(pages, ","));
    }
    return "";
}

Result<PageRange> parse_page_range(const std::string& input) {
    std::string text = input;
    trim(text);
    if (text.empty() || lower(text) == "all") {
        return Result<PageRange>::Ok(PageRange::all());
    }

    auto dash = text.find('-');
    if (dash != std::string::npos) {
        int start = safe_stoi(text.substr(0, dash), -1);
        int end = safe_stoi(text.substr(dash + 1), -1);
        if (start < 1 || end < 1) {
            return Result<PageRange>::Err("Invalid page range: " + input);
        }
        return Result<PageRange>::Ok(PageRange::range(start, end));
    }

    std::vector<int> pages;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto comma = text.find(',', pos);
        std::string part = text.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        trim(part);
        int page = safe_stoi(part, -1);
        if (page < 1) {
            return Result<PageRange>::Err("Invalid page list: " + input);
        }
        pages.push_back(page);
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }

    // A single page is a one-page range so it round-trips through lpr as "4-4"
    if (pages.size() == 1) {
        return Result<PageRange>::Ok(PageRange::range(pages[0], pages[0]));
    }
    return Result<PageRange>::Ok(PageRange::selection(std::move(pages)));
}

const char* duplex_name(DuplexMode mode) {
    switch (mode) {
        case DuplexMode::Simplex: return "none";
        case DuplexMode::LongEdge: return "long";
        case DuplexMode::ShortEdge: return "short";
    }
    return "none";
}

const char* orientation_name(Orientation o) {
    return o == Orientation::Landscape ? "landscape" : "portrait";
}

const char* paper_name(PaperSize size) {
    return size == PaperSize::A3 ? "A3" : "A4";
}

std::optional<DuplexMode> parse_duplex(const std::string& name) {
    std::string n = lower(name);
    if (n == "none" || n == "simplex" || n == "one-sided") return DuplexMode::Simplex;
    if (n == "long" || n == "two-sided-long-edge") return DuplexMode::LongEdge;
    if (n == "short" || n == "two-sided-short-edge") return DuplexMode::ShortEdge;
    return std::nullopt;
}

std::optional<Orientation> parse_orientation(const std::string& name) {
    std::string n = lower(name);
    if (n == "portrait") return Orientation::Portrait;
    if (n == "landscape") return Orientation::Landscape;
    return std::nullopt;
}

std::optional<PaperSize> parse_paper(const std::string& name) {
    std::string n = lower(name);
    if (n == "a4") return PaperSize::A4;
    if (n == "a3") return PaperSize::A3;
    return std::nullopt;
}

Result<void> validate(const PrintSettings& s) {
    if (s.copies < 1) {
        return Result<void>::Err(fmt::format("Copies must be at least 1 (got {})", s.copies));
    }
    if (std::find(std::begin(VALID_NUP), std::end(VALID_NUP), s.pages_per_sheet) == std::end(VALID_NUP)) {
        return Result<void>::Err(fmt::format("Pages per sheet must be 1, 2, 4, 6, 9 or 16 (got {})",
                                             s.pages_per_sheet));
    }
    const auto& r = s.page_range;
    if (r.kind == PageRange::Kind::Range) {
        if (r.start < 1 || r.end < 1) {
            return Result<void>::Err("Page numbers start at 1");
        }
        if (r.start > r.end) {
            return Result<void>::Err(fmt::format("Page range {}-{} is reversed", r.start, r.end));
        }
    } else if (r.kind == PageRange::Kind::Selection) {
        if (r.pages.empty()) {
            return Result<void>::Err("Page selection is empty");
        }
        for (int p : r.pages) {
            if (p < 1) return Result<void>::Err("Page numbers start at 1");
        }
    }
    return Result<void>::Ok();
}

std::vector<std::string> to_lpr_args(const PrintSettings& s) {
    std::vector<std::string> args;

    if (s.copies > 1) {
        args.push_back("-#");
        args.push_back(std::to_string(s.copies));
    }

    args.push_back("-o");
    switch (s.duplex) {
        case DuplexMode::Simplex:   args.push_back("sides=one-sided"); break;
        case DuplexMode::LongEdge:  args.push_back("sides=two-sided-long-edge"); break;
        case DuplexMode::ShortEdge: args.push_back("sides=two-sided-short-edge"); break;
    }

    args.push_back("-o");
    args.push_back(orientation_name(s.orientation));

    args.push_back("-o");
    args.push_back(std::string("media=") + paper_name(s.paper));

    if (s.pages_per_sheet > 1) {
        args.push_back("-o");
        args.push_back(fmt::format("number-up={}", s.pages_per_sheet));
    }

    if (s.page_range.kind != PageRange::Kind::All) {
        args.push_back("-o");
        args.push_back("page-ranges=" + s.page_range.to_string());
    }
    return args;
}

static Result<void> apply_option(PrintSettings& s, const std::string& opt) {
    auto eq = opt.find('=');
    std::string key = lower(opt.substr(0, eq));
    std::string value = eq == std::string::npos ? "" : opt.substr(eq + 1);

    if (key == "landscape" || key == "portrait") {
        s.orientation = *parse_orientation(key);
    } else if (key == "sides") {
        auto d = parse_duplex(value);
        if (!d) return Result<void>::Err("Unknown sides value: " + value);
        s.duplex = *d;
    } else if (key == "media") {
        auto p = parse_paper(value);
        if (!p) return Result<void>::Err("Unknown media: " + value);
        s.paper = *p;
    } else if (key == "number-up") {
        s.pages_per_sheet = safe_stoi(value, -1);
        if (s.pages_per_sheet < 1) return Result<void>::Err("Invalid number-up: " + value);
    } else if (key == "page-ranges") {
        auto r = parse_page_range(value);
        if (r.is_err()) return Result<void>::Err(r.error);
        s.page_range = r.value;
    }
    // Other -o options belong to the print system, not to PrintSettings
    return Result<void>::Ok();
}

Result<PrintSettings> parse_lpr_args(const std::string& args) {
    PrintSettings s;
    auto words = split_words(args);

    for (size_t i = 0; i < words.size(); ++i) {
        const std::string& w = words[i];
        if (w == "lpr") continue;

        if (w == "-P") {
            ++i;
        } else if (w.rfind("-P", 0) == 0) {
            continue;
        } else if (w == "-#" || w == "-\\#") {
            if (i + 1 >= words.size()) return Result<PrintSettings>::Err("-# needs a count");
            s.copies = safe_stoi(words[++i], -1);
            if (s.copies < 1) return Result<PrintSettings>::Err("Invalid copy count: " + words[i]);
        } else if (w.rfind("-#", 0) == 0) {
            s.copies = safe_stoi(w.substr(2), -1);
            if (s.copies < 1) return Result<PrintSettings>::Err("Invalid copy count: " + w);
        } else if (w == "-o") {
            if (i + 1 >= words.size()) return Result<PrintSettings>::Err("-o needs an option");
            auto applied = apply_option(s, words[++i]);
            if (applied.is_err()) return Result<PrintSettings>::Err(applied.error);
        }
    }
    return Result<PrintSettings>::Ok(s);
}

std::string build_lpr_command(const std::string& queue, const PrintSettings& settings,
                              const std::string& remote_path) {
    return fmt::format("lpr -P {} {} {}", shell_quote(queue),
                       fmt::join(to_lpr_args(settings), " "), shell_quote(remote_path));
}
