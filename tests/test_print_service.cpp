#include <gtest/gtest.h>
#include <managers/print_service.hpp>
#include "fake_remote_session.hpp"
#include <fmt/format.h>
#include <fstream>
#include <thread>

class PrintServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("socprint_service_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::error_code ec;
        fs::remove_all(dir_, ec);
        fs::create_directories(dir_);
        file_ = (dir_ / "essay.pdf").string();
        std::ofstream(file_) << "%PDF-1.4";

        // Keeps submitted jobs Queued whenever the first poll round lands
        script(*opener_.session, "1st     alice   77      essay.pdf     8 bytes");
    }

    static void script(FakeRemoteSession& session, const std::string& psts_row) {
        session.on("lpr", 0, "request id is psts-77 (1 file(s))");
        session.on("lpq -P 'psts'", 0,
                   "psts is ready\n"
                   "Rank    Owner   Job     File(s)       Total Size\n" + psts_row);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    Config config() const {
        ConnectionConfig conn;
        conn.host = "printhost";
        conn.user = "alice";
        return Config::build(conn, {"psts", "psc008"}, 3600, 1, 0, "/tmp");
    }

    std::unique_ptr<PrintService> make_service() {
        auto s = std::make_unique<PrintService>(config(), opener_.opener(), dir_ / "state");
        EXPECT_TRUE(s->init().is_ok());
        return s;
    }

    ConnectionConfig target() const {
        ConnectionConfig c = config().connection();
        c.secret = "pw";
        return c;
    }

    fs::path dir_;
    std::string file_;
    FakeOpener opener_;
};

TEST_F(PrintServiceTest, ConnectStartsPollingAndRemembersTarget) {
    auto service = make_service();
    ASSERT_TRUE(service->connect(target()).is_ok());
    EXPECT_TRUE(service->is_connected());

    ASSERT_TRUE(eventually([&] { return service->queue_snapshot("psts").has_value(); }));
    EXPECT_FALSE(service->queue_snapshot("psts")->error.has_value());

    auto remembered = service->preferred_connection();
    EXPECT_EQ(remembered.target(), "alice@printhost");
    EXPECT_TRUE(remembered.secret.empty());

    ASSERT_TRUE(service->disconnect().is_ok());
    EXPECT_EQ(service->refresh().kind, ErrorKind::NotConnected);
}

TEST_F(PrintServiceTest, PollingStopsWhileReconnecting) {
    auto service = make_service();
    ASSERT_TRUE(service->connect(target()).is_ok());
    ASSERT_TRUE(eventually([&] { return service->queue_snapshot("psts").has_value(); }));

    auto next = std::make_shared<FakeRemoteSession>();
    script(*next, "");
    opener_.session = next;
    opener_.delay = std::chrono::milliseconds(800);

    Result<void> reconnected = Result<void>::Ok();
    std::thread t([&] { reconnected = service->connect(target()); });
    ASSERT_TRUE(eventually([&] {
        return std::holds_alternative<Connecting>(service->status());
    }));

    EXPECT_EQ(service->refresh().kind, ErrorKind::NotConnected);
    auto kept = service->queue_snapshot("psts");
    ASSERT_TRUE(kept.has_value());
    EXPECT_FALSE(kept->error.has_value());

    t.join();
    ASSERT_TRUE(reconnected.is_ok()) << reconnected.error;
    ASSERT_TRUE(eventually([&] { return next->count_prefix("lpq -P 'psts'") >= 1; }));
    EXPECT_TRUE(service->refresh().is_ok());
}

TEST_F(PrintServiceTest, PollTickMovesSubmittedJobToPrinting) {
    auto session = std::make_shared<FakeRemoteSession>();
    script(*session, "active  alice   77      essay.pdf     8 bytes");
    opener_.session = session;

    auto service = make_service();
    ASSERT_TRUE(service->connect(target()).is_ok());

    auto r = service->submit(file_, "psts", PrintSettings{});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const std::string id = r.value.jobs[0].id;
    EXPECT_EQ(r.value.jobs[0].remote_id, "psts-77");

    // Only a listing issued after lpr may move the job
    ASSERT_TRUE(eventually([&] {
        auto refreshed = service->refresh();
        if (refreshed.is_err()) return false;
        return service->find_job(id).value.status == JobStatus::Printing;
    }));
}

TEST_F(PrintServiceTest, ConcurrentChangesAllReachDisk) {
    {
        auto service = make_service();
        std::vector<std::thread> writers;
        for (int i = 0; i < 8; ++i) {
            writers.emplace_back([&service, this, i] {
                DraftJob d;
                d.source_path = (dir_ / fmt::format("doc{}.pdf", i)).string();
                service->save_draft(d);
            });
        }
        for (auto& w : writers) w.join();
    }
    auto again = make_service();
    EXPECT_EQ(again->drafts().size(), 8u);
}

TEST_F(PrintServiceTest, SubmitUsesDefaultQueueAndDropsDraft) {
    auto service = make_service();
    ASSERT_TRUE(service->connect(target()).is_ok());

    DraftJob d;
    d.source_path = file_;
    d.settings.duplex = DuplexMode::LongEdge;
    service->save_draft(d);
    ASSERT_EQ(service->drafts().size(), 1u);

    auto r = service->submit(file_, "", d.settings);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.jobs[0].queue, "psts");
    EXPECT_EQ(r.value.jobs[0].remote_id, "psts-77");
    EXPECT_TRUE(service->drafts().empty());

    // Source backed up under the state directory
    auto backup = service->state_store().backup_dir(r.value.jobs[0].id) / "essay.pdf";
    EXPECT_TRUE(fs::exists(backup));
}

TEST_F(PrintServiceTest, SendDraftSubmitsSavedSettings) {
    auto service = make_service();
    ASSERT_TRUE(service->connect(target()).is_ok());

    DraftJob d;
    d.source_path = file_;
    d.queue = "psc008";
    d.settings.pages_per_sheet = 2;
    service->save_draft(d);

    auto r = service->send_draft(file_);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.jobs[0].queue, "psc008");
    EXPECT_EQ(r.value.jobs[0].settings.pages_per_sheet, 2);
    EXPECT_EQ(opener_.session->count_prefix("lpr -P 'psc008'"), 1);
    EXPECT_EQ(service->send_draft(file_).kind, ErrorKind::NotFound);
}

TEST_F(PrintServiceTest, JobsSurviveRestart) {
    std::string id;
    {
        auto service = make_service();
        ASSERT_TRUE(service->connect(target()).is_ok());
        auto r = service->submit(file_, "psts", PrintSettings{});
        ASSERT_TRUE(r.is_ok());
        id = r.value.jobs[0].id;
    }

    auto again = make_service();
    auto job = again->find_job(id);
    ASSERT_TRUE(job.is_ok());
    EXPECT_EQ(job.value.status, JobStatus::Queued);
    EXPECT_EQ(job.value.remote_id, "psts-77");
    EXPECT_EQ(again->preferred_connection().user, "alice");
}

TEST_F(PrintServiceTest, FindJobByPrefixOrSuffix) {
    auto service = make_service();
    ASSERT_TRUE(service->connect(target()).is_ok());
    auto r = service->submit(file_, "psts", PrintSettings{});
    ASSERT_TRUE(r.is_ok());
    const std::string id = r.value.jobs[0].id;

    EXPECT_EQ(service->find_job(id.substr(id.size() - 6)).value.id, id);
    EXPECT_EQ(service->find_job(id.substr(0, 20)).value.id, id);
    EXPECT_EQ(service->find_job("zzzz").kind, ErrorKind::NotFound);
}

TEST_F(PrintServiceTest, RemoveRefusesActiveJobs) {
    auto service = make_service();
    ASSERT_TRUE(service->connect(target()).is_ok());
    auto r = service->submit(file_, "psts", PrintSettings{});
    ASSERT_TRUE(r.is_ok());
    const std::string id = r.value.jobs[0].id;

    EXPECT_EQ(service->remove_job(id).kind, ErrorKind::InvalidTransition);
    ASSERT_TRUE(service->cancel(id).is_ok());
    ASSERT_TRUE(service->remove_job(id).is_ok());
    EXPECT_TRUE(service->list_jobs().empty());
    EXPECT_FALSE(fs::exists(service->state_store().backup_dir(id)));
}

TEST_F(PrintServiceTest, CleanupDropsOnlyOldTerminalJobs) {
    fs::create_directories(dir_ / "state");
    std::ofstream(dir_ / "state" / "state.yaml") << R"(
jobs:
  - id: old-done
    name: a.pdf
    queue: psts
    status: completed
    created_at: "2020-01-01T10:00:00"
    updated_at: "2020-01-01T10:05:00"
  - id: old-queued
    name: b.pdf
    queue: psts
    status: queued
    remote_id: psts-5
    created_at: "2020-01-01T10:00:00"
    updated_at: "2020-01-01T10:05:00"
)";
    auto service = make_service();
    ASSERT_EQ(service->list_jobs().size(), 2u);
    EXPECT_EQ(service->cleanup(30), 1);
    auto left = service->list_jobs();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, "old-queued");
}

TEST_F(PrintServiceTest, DefaultQueuePreference) {
    {
        auto service = make_service();
        EXPECT_EQ(service->default_queue(), "psts");
        ASSERT_TRUE(service->set_default_queue("psc008").is_ok());
        EXPECT_EQ(service->set_default_queue("").kind, ErrorKind::Config);
    }
    auto again = make_service();
    EXPECT_EQ(again->default_queue(), "psc008");
}

TEST_F(PrintServiceTest, CorruptStateStillStarts) {
    fs::create_directories(dir_ / "state");
    std::ofstream(dir_ / "state" / "state.yaml") << "jobs: [ {";
    PrintService service(config(), opener_.opener(), dir_ / "state");
    auto r = service.init();
    EXPECT_EQ(r.kind, ErrorKind::Storage);
    EXPECT_TRUE(service.list_jobs().empty());
}
