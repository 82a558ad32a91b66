#include <gtest/gtest.h>
#include <managers/lpr_helpers.hpp>

TEST(LprHelpers, ParsesRequestId) {
    EXPECT_EQ(parse_lpr_request_id("request id is psts-123 (1 file(s))"), "psts-123");
    EXPECT_EQ(parse_lpr_request_id("warning: foo\nrequest id is psc008-7 (0 file(s))\n"), "psc008-7");
    EXPECT_FALSE(parse_lpr_request_id("lpr: error - no default destination").has_value());
}

TEST(LprHelpers, RemoteJobNumber) {
    EXPECT_EQ(remote_job_number("psts-123"), 123);
    EXPECT_EQ(remote_job_number("pstsc-b-9"), 9);
    EXPECT_EQ(remote_job_number("42"), 42);
    EXPECT_FALSE(remote_job_number("psts-").has_value());
    EXPECT_FALSE(remote_job_number("psts-abc").has_value());
}

TEST(LprHelpers, ParsesLpqListing) {
    std::vector<std::string> lines = {
        "psts is ready and printing",
        "Rank    Owner   Job     File(s)                         Total Size",
        "active  alice   123     report.pdf                      1024 bytes",
        "1st     bob     124     my thesis final.pdf             20480 bytes",
        "2nd     carol   125     (stdin)                         512 bytes",
    };
    auto entries = parse_lpq_output(lines);
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_TRUE(entries[0].is_active());
    EXPECT_EQ(entries[0].owner, "alice");
    EXPECT_EQ(entries[0].job_number, 123);
    EXPECT_EQ(entries[0].file, "report.pdf");
    EXPECT_EQ(entries[0].size_bytes, 1024);

    EXPECT_FALSE(entries[1].is_active());
    EXPECT_EQ(entries[1].file, "my thesis final.pdf");
    EXPECT_EQ(entries[1].size_bytes, 20480);
}

TEST(LprHelpers, OversizedNumbersDoNotThrow) {
    std::vector<LpqEntry> entries;
    ASSERT_NO_THROW(entries = parse_lpq_output(
        {"active  alice  12  essay.pdf  99999999999999999999 bytes",
         "1st     alice  99999999999999999999  big.pdf  10 bytes"}));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].job_number, 12);
    EXPECT_EQ(entries[0].size_bytes, 0);
    EXPECT_EQ(entries[0].file, "essay.pdf");
    EXPECT_EQ(entries[1].job_number, 0);
}

TEST(LprHelpers, EmptyQueueHasNoEntries) {
    EXPECT_TRUE(parse_lpq_output({"psts is ready", "no entries"}).empty());
}

TEST(LprHelpers, FindEntryByRemoteId) {
    auto entries = parse_lpq_output({"active  alice   123     a.pdf  10 bytes",
                                     "1st     alice   124     b.pdf  10 bytes"});
    const LpqEntry* e = find_lpq_entry(entries, "psts-124");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->file, "b.pdf");
    EXPECT_EQ(find_lpq_entry(entries, "psts-999"), nullptr);
}

TEST(LprHelpers, Commands) {
    EXPECT_EQ(lpq_command("psts"), "lpq -P 'psts'");
    EXPECT_EQ(lprm_command("psts", "psts-123"), "lprm -P 'psts' 123");
}
