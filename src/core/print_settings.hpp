#pragma once

#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

enum class DuplexMode {
    Simplex,
    LongEdge,
    ShortEdge,
};

enum class Orientation {
    Portrait,
    Landscape,
};

enum class PaperSize {
    A4,
    A3,
};

// Pages to print. `All` emits no page-ranges option.
struct PageRange {
    enum class Kind { All, Range, Selection };

    Kind kind = Kind::All;
    int start = 0;              // Range only, 1-based inclusive
    int end = 0;
    std::vector<int> pages;     // Selection only

    static PageRange all() { return {}; }
    static PageRange range(int start, int end) { return {Kind::Range, start, end, {}}; }
    static PageRange selection(std::vector<int> pages) { return {Kind::Selection, 0, 0, std::move(pages)}; }

    // "1-3", "1,3,5"; empty for All
    std::string to_string() const;

    bool operator==(const PageRange& o) const {
        return kind == o.kind && start == o.start && end == o.end && pages == o.pages;
    }
    bool operator!=(const PageRange& o) const { return !(*this == o); }
};

// Parse "all", "1-3", "4" or "1,3,5".
Result<PageRange> parse_page_range(const std::string& text);

struct PrintSettings {
    int copies = 1;
    DuplexMode duplex = DuplexMode::Simplex;
    Orientation orientation = Orientation::Portrait;
    PaperSize paper = PaperSize::A4;
    int pages_per_sheet = 1;
    PageRange page_range;

    bool operator==(const PrintSettings& o) const {
        return copies == o.copies && duplex == o.duplex && orientation == o.orientation &&
               paper == o.paper && pages_per_sheet == o.pages_per_sheet &&
               page_range == o.page_range;
    }
    bool operator!=(const PrintSettings& o) const { return !(*this == o); }
};

const char* duplex_name(DuplexMode mode);          // "none", "long", "short"
const char* orientation_name(Orientation o);       // "portrait", "landscape"
const char* paper_name(PaperSize size);            // "A4", "A3"
std::optional<DuplexMode> parse_duplex(const std::string& name);
std::optional<Orientation> parse_orientation(const std::string& name);
std::optional<PaperSize> parse_paper(const std::string& name);

// Copies >= 1, N-up in {1,2,4,6,9,16}, page numbers >= 1, start <= end.
Result<void> validate(const PrintSettings& settings);

// lpr flags for the settings, without "-P" or the file:
//   -# 2 -o sides=two-sided-long-edge -o portrait -o media=A4 -o number-up=2 -o page-ranges=1-3
std::vector<std::string> to_lpr_args(const PrintSettings& settings);

// Inverse of to_lpr_args. Accepts a bare flag list or a whole lpr command
// line; "-P queue" and positional file arguments are skipped.
Result<PrintSettings> parse_lpr_args(const std::string& args);

// "lpr -P <queue> <flags> '<remote_path>'"
std::string build_lpr_command(const std::string& queue, const PrintSettings& settings,
                              const std::string& remote_path);
