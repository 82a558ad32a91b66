#include <gtest/gtest.h>
#include <managers/draft_store.hpp>

static DraftJob draft_for(const std::string& path, int copies) {
    DraftJob d;
    d.source_path = path;
    d.settings.copies = copies;
    return d;
}

TEST(DraftStore, SaveSupersedesSamePath) {
    DraftStore store;
    store.save(draft_for("/home/u/a.pdf", 1));
    store.save(draft_for("/home/u/a.pdf", 3));

    auto all = store.list();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].settings.copies, 3);
}

TEST(DraftStore, PathsAreNormalized) {
    DraftStore store;
    store.save(draft_for("/home/u/docs/../a.pdf", 2));
    auto d = store.get("/home/u/a.pdf");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->settings.copies, 2);
    EXPECT_EQ(d->source_path, "/home/u/a.pdf");
}

TEST(DraftStore, RemoveAndMissing) {
    DraftStore store;
    store.save(draft_for("/tmp/a.pdf", 1));
    EXPECT_TRUE(store.remove("/tmp/a.pdf"));
    EXPECT_FALSE(store.remove("/tmp/a.pdf"));
    EXPECT_FALSE(store.get("/tmp/a.pdf").has_value());
}

TEST(DraftStore, ListNewestFirst) {
    DraftStore store;
    DraftJob older = draft_for("/tmp/old.pdf", 1);
    older.updated_at = "2026-01-01T00:00:00";
    DraftJob newer = draft_for("/tmp/new.pdf", 1);
    newer.updated_at = "2026-02-01T00:00:00";
    store.restore({older, newer});

    auto all = store.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].source_path, "/tmp/new.pdf");
    EXPECT_EQ(all[0].updated_at, "2026-02-01T00:00:00");
}
