#include <gtest/gtest.h>
#include <core/print_settings.hpp>
#include <cli/print_options.hpp>

// ── to_lpr_args ─────────────────────────────────────────────

TEST(PrintSettings, DefaultArgs) {
    auto args = to_lpr_args(PrintSettings{});
    std::vector<std::string> expected = {"-o", "sides=one-sided", "-o", "portrait", "-o", "media=A4"};
    EXPECT_EQ(args, expected);
}

TEST(PrintSettings, FullArgs) {
    PrintSettings s;
    s.copies = 3;
    s.duplex = DuplexMode::LongEdge;
    s.orientation = Orientation::Landscape;
    s.paper = PaperSize::A3;
    s.pages_per_sheet = 4;
    s.page_range = PageRange::range(2, 7);

    std::vector<std::string> expected = {
        "-#", "3",
        "-o", "sides=two-sided-long-edge",
        "-o", "landscape",
        "-o", "media=A3",
        "-o", "number-up=4",
        "-o", "page-ranges=2-7",
    };
    EXPECT_EQ(to_lpr_args(s), expected);
}

TEST(PrintSettings, SelectionArgs) {
    PrintSettings s;
    s.page_range = PageRange::selection({1, 3, 5});
    auto args = to_lpr_args(s);
    EXPECT_EQ(args.back(), "page-ranges=1,3,5");
}

TEST(PrintSettings, BuildCommandQuotesQueueAndPath) {
    PrintSettings s;
    s.duplex = DuplexMode::ShortEdge;
    EXPECT_EQ(build_lpr_command("psts", s, "/tmp/abc.pdf"),
              "lpr -P 'psts' -o sides=two-sided-short-edge -o portrait -o media=A4 '/tmp/abc.pdf'");
}

// ── parse_lpr_args ──────────────────────────────────────────

TEST(PrintSettings, TranslateThenParseReproducesSettings) {
    std::vector<PrintSettings> cases(4);
    cases[1].copies = 2;
    cases[1].duplex = DuplexMode::ShortEdge;
    cases[2].orientation = Orientation::Landscape;
    cases[2].paper = PaperSize::A3;
    cases[2].pages_per_sheet = 16;
    cases[3].page_range = PageRange::selection({2, 4, 9});
    cases[3].duplex = DuplexMode::LongEdge;

    for (const auto& s : cases) {
        auto parsed = parse_lpr_args(build_lpr_command("psc008", s, "/tmp/f.pdf"));
        ASSERT_TRUE(parsed.is_ok()) << parsed.error;
        EXPECT_EQ(parsed.value, s);
    }
}

TEST(PrintSettings, ParseAcceptsCopyCountSpellings) {
    EXPECT_EQ(parse_lpr_args("lpr -# 4 file").value.copies, 4);
    EXPECT_EQ(parse_lpr_args("lpr -\\# 5 file").value.copies, 5);
    EXPECT_EQ(parse_lpr_args("lpr -#6 file").value.copies, 6);
}

TEST(PrintSettings, ParseIgnoresUnknownOptions) {
    auto parsed = parse_lpr_args("lpr -P psts -o fit-to-page -o media=A3 f.pdf");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value.paper, PaperSize::A3);
}

TEST(PrintSettings, ParseRejectsBadValues) {
    EXPECT_TRUE(parse_lpr_args("lpr -# zero f").is_err());
    EXPECT_TRUE(parse_lpr_args("lpr -o sides=sideways f").is_err());
    EXPECT_TRUE(parse_lpr_args("lpr -o").is_err());
}

// ── validate ────────────────────────────────────────────────

TEST(PrintSettings, ValidateRejectsIllegalValues) {
    PrintSettings s;
    EXPECT_TRUE(validate(s).is_ok());

    s.copies = 0;
    EXPECT_TRUE(validate(s).is_err());
    s.copies = 1;

    s.pages_per_sheet = 3;
    EXPECT_TRUE(validate(s).is_err());
    s.pages_per_sheet = 9;
    EXPECT_TRUE(validate(s).is_ok());

    s.page_range = PageRange::range(5, 2);
    EXPECT_TRUE(validate(s).is_err());
}

// ── parse_page_range ────────────────────────────────────────

TEST(PageRange, Parse) {
    EXPECT_EQ(parse_page_range("all").value, PageRange::all());
    EXPECT_EQ(parse_page_range("").value, PageRange::all());
    EXPECT_EQ(parse_page_range("1-3").value, PageRange::range(1, 3));
    EXPECT_EQ(parse_page_range("4").value, PageRange::range(4, 4));
    EXPECT_EQ(parse_page_range("1, 3,5").value, PageRange::selection({1, 3, 5}));
    EXPECT_TRUE(parse_page_range("0-2").is_err());
    EXPECT_TRUE(parse_page_range("a,b").is_err());
}

// ── CLI print options ───────────────────────────────────────

TEST(PrintOptions, ParsesFileQueueAndFlags) {
    auto req = parse_print_options({"notes.pdf", "psc008", "-n", "2", "--duplex", "long",
                                    "--paper", "A3", "--landscape", "--nup", "2",
                                    "--pages", "1-4"});
    ASSERT_TRUE(req.is_ok()) << req.error;
    EXPECT_EQ(req.value.file, "notes.pdf");
    EXPECT_EQ(req.value.queue, "psc008");
    EXPECT_EQ(req.value.settings.copies, 2);
    EXPECT_EQ(req.value.settings.duplex, DuplexMode::LongEdge);
    EXPECT_EQ(req.value.settings.paper, PaperSize::A3);
    EXPECT_EQ(req.value.settings.orientation, Orientation::Landscape);
    EXPECT_EQ(req.value.settings.pages_per_sheet, 2);
    EXPECT_EQ(req.value.settings.page_range, PageRange::range(1, 4));
}

TEST(PrintOptions, LayersOverBaseSettings) {
    PrintSettings base;
    base.copies = 5;
    base.duplex = DuplexMode::ShortEdge;
    auto req = parse_print_options({"a.pdf", "--portrait"}, base);
    ASSERT_TRUE(req.is_ok());
    EXPECT_EQ(req.value.settings.copies, 5);
    EXPECT_EQ(req.value.settings.duplex, DuplexMode::ShortEdge);
    EXPECT_TRUE(req.value.queue.empty());
}

TEST(PrintOptions, RejectsBadInput) {
    EXPECT_TRUE(parse_print_options({}).is_err());
    EXPECT_TRUE(parse_print_options({"a.pdf", "--nup", "3"}).is_err());
    EXPECT_TRUE(parse_print_options({"a.pdf", "-n"}).is_err());
    EXPECT_TRUE(parse_print_options({"a.pdf", "--staple"}).is_err());
    EXPECT_TRUE(parse_print_options({"a.pdf", "q", "extra"}).is_err());
}
