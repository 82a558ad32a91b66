#include <gtest/gtest.h>
#include <managers/state_store.hpp>
#include <fstream>

namespace {

fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("socprint_state_" + name);
    std::error_code ec;
    fs::remove_all(dir, ec);
    return dir;
}

} // namespace

TEST(StateStore, MissingFilesLoadEmpty) {
    StateStore store(fresh_dir("missing"));
    auto state = store.load();
    ASSERT_TRUE(state.is_ok());
    EXPECT_TRUE(state.value.jobs.empty());
    EXPECT_FALSE(state.value.last_connection.has_value());

    auto prefs = store.load_preferences();
    ASSERT_TRUE(prefs.is_ok());
    EXPECT_TRUE(prefs.value.default_queue.empty());
}

TEST(StateStore, SaveThenLoadKeepsJobsDraftsAndConnection) {
    auto dir = fresh_dir("roundtrip");
    StateStore store(dir);

    PersistedState state;
    PrintJob j;
    j.id = "20260101-100000-000-abcde0";
    j.name = "notes-copy2.pdf";
    j.source_path = "/home/alice/notes.pdf";
    j.queue = "psts";
    j.settings.duplex = DuplexMode::LongEdge;
    j.settings.page_range = PageRange::selection({1, 3});
    j.status = JobStatus::Failed;
    j.remote_id = "psts-12";
    j.error = "Cancel failed: Not connected";
    j.created_at = "2026-01-01T10:00:00";
    j.updated_at = "2026-01-01T10:05:00";
    j.copy_index = 2;
    state.jobs.push_back(j);

    DraftJob d;
    d.source_path = "/home/alice/slides.pdf";
    d.settings.pages_per_sheet = 4;
    d.updated_at = "2026-01-02T09:00:00";
    state.drafts.push_back(d);

    ConnectionConfig c;
    c.host = "printhost";
    c.user = "alice";
    c.port = 2222;
    c.secret = "hunter2";
    state.last_connection = c;

    ASSERT_TRUE(store.save(state).is_ok());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    ASSERT_EQ(loaded.value.jobs.size(), 1u);
    const auto& lj = loaded.value.jobs[0];
    EXPECT_EQ(lj.id, j.id);
    EXPECT_EQ(lj.name, j.name);
    EXPECT_EQ(lj.settings, j.settings);
    EXPECT_EQ(lj.status, JobStatus::Failed);
    EXPECT_EQ(lj.remote_id, j.remote_id);
    EXPECT_EQ(lj.error, j.error);
    EXPECT_FALSE(lj.staged_path.has_value());
    EXPECT_EQ(lj.updated_at, j.updated_at);
    EXPECT_EQ(lj.copy_index, 2);

    ASSERT_EQ(loaded.value.drafts.size(), 1u);
    EXPECT_EQ(loaded.value.drafts[0].settings.pages_per_sheet, 4);

    ASSERT_TRUE(loaded.value.last_connection.has_value());
    EXPECT_EQ(loaded.value.last_connection->port, 2222);
    EXPECT_TRUE(loaded.value.last_connection->secret.empty());

    // The secret never reaches the file.
    std::ifstream in(store.state_path());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text.find("hunter2"), std::string::npos);
    EXPECT_FALSE(fs::exists(store.state_path().string() + ".tmp"));
}

TEST(StateStore, CorruptFileIsStorageError) {
    auto dir = fresh_dir("corrupt");
    fs::create_directories(dir);
    std::ofstream(dir / "state.yaml") << "jobs: [ {id: \"x\", ";
    StateStore store(dir);
    auto r = store.load();
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Storage);
}

TEST(StateStore, PreferencesAreSeparate) {
    auto dir = fresh_dir("prefs");
    StateStore store(dir);
    Preferences p;
    p.default_queue = "psc008";
    ASSERT_TRUE(store.save_preferences(p).is_ok());
    EXPECT_EQ(store.load_preferences().value.default_queue, "psc008");
    EXPECT_FALSE(fs::exists(store.state_path()));
}

TEST(StateStore, BackupAndRemove) {
    auto dir = fresh_dir("backup");
    fs::create_directories(dir);
    fs::path src = dir / "report.pdf";
    std::ofstream(src) << "data";

    StateStore store(dir);
    auto r = store.backup_source("job1", src);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, dir / "backups" / "job1" / "report.pdf");
    EXPECT_TRUE(fs::exists(r.value));

    store.remove_backup("job1");
    EXPECT_FALSE(fs::exists(store.backup_dir("job1")));

    EXPECT_EQ(store.backup_source("job2", dir / "absent.pdf").kind, ErrorKind::Storage);
}
