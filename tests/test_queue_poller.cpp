#include <gtest/gtest.h>
#include <managers/command_serializer.hpp>
#include <managers/queue_poller.hpp>
#include "fake_remote_session.hpp"
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace {

const char* PSTS_LISTING =
    "psts is ready and printing\n"
    "Rank    Owner   Job     File(s)                         Total Size\n"
    "active  alice   123     report.pdf                      1024 bytes\n";

} // namespace

TEST(QueuePoller, FirstRoundRunsImmediately) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->on("lpq -P 'psts'", 0, PSTS_LISTING);
    fake->on("lpq -P 'psc008'", 0, "psc008 is ready\nno entries");
    CommandSerializer serializer;
    serializer.attach(fake);

    QueuePoller poller(serializer, {"psts", "psc008"}, 1h);
    poller.start();
    ASSERT_TRUE(eventually([&] { return poller.rounds_completed() >= 1; }));
    poller.stop();

    auto psts = poller.snapshot("psts");
    ASSERT_TRUE(psts.has_value());
    EXPECT_FALSE(psts->error.has_value());
    EXPECT_EQ(psts->lines.size(), 3u);
    EXPECT_FALSE(psts->refreshed_at.empty());
    EXPECT_EQ(poller.snapshots().size(), 2u);
}

TEST(QueuePoller, PerQueueErrorsDoNotStopTheRound) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->on("lpq -P 'psts'", 0, PSTS_LISTING);
    fake->on("lpq -P 'bogus'", 1, "lpq: Unknown destination \"bogus\".");
    CommandSerializer serializer;
    serializer.attach(fake);

    std::mutex m;
    std::vector<std::string> listed;
    std::vector<LpqEntry> psts_entries;
    QueuePoller poller(serializer, {"bogus", "psts"}, 1h);
    poller.set_listing_callback([&](const std::string& q, const std::vector<LpqEntry>& e, uint64_t seq) {
        std::lock_guard<std::mutex> lock(m);
        listed.push_back(q);
        if (q == "psts") psts_entries = e;
        EXPECT_GT(seq, 0u);
    });

    EXPECT_TRUE(poller.refresh_now());

    auto bogus = poller.snapshot("bogus");
    ASSERT_TRUE(bogus.has_value());
    ASSERT_TRUE(bogus->error.has_value());
    EXPECT_NE(bogus->error->find("Unknown destination"), std::string::npos);

    std::lock_guard<std::mutex> lock(m);
    EXPECT_EQ(listed, std::vector<std::string>{"psts"});
    ASSERT_EQ(psts_entries.size(), 1u);
    EXPECT_EQ(psts_entries[0].job_number, 123);
}

TEST(QueuePoller, RefreshCoalescesWithRoundInFlight) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->hold("lpq -P 'psts'");
    CommandSerializer serializer;
    serializer.attach(fake);

    QueuePoller poller(serializer, {"psts"}, 1h);
    poller.start();
    ASSERT_TRUE(fake->wait_until_held());

    EXPECT_FALSE(poller.refresh_now());
    fake->release();
    ASSERT_TRUE(eventually([&] { return poller.rounds_completed() == 1; }));
    EXPECT_TRUE(poller.refresh_now());
    poller.stop();

    EXPECT_EQ(fake->count_prefix("lpq"), 2);
}

TEST(QueuePoller, OverrunningRoundDropsMissedTicks) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->hold("lpq -P 'psts'");
    CommandSerializer serializer;
    serializer.attach(fake);

    QueuePoller poller(serializer, {"psts"}, 20ms);
    poller.start();
    ASSERT_TRUE(fake->wait_until_held());
    std::this_thread::sleep_for(120ms);
    fake->release();

    ASSERT_TRUE(eventually([&] { return poller.ticks_skipped() >= 1; }));
    poller.stop();
}

TEST(QueuePoller, NotConnectedShowsAsSnapshotError) {
    CommandSerializer serializer;
    QueuePoller poller(serializer, {"psts"}, 1h);
    std::vector<QueueSnapshot> seen;
    poller.set_snapshot_callback([&](const QueueSnapshot& s) { seen.push_back(s); });

    EXPECT_TRUE(poller.refresh_now());
    ASSERT_EQ(seen.size(), 1u);
    ASSERT_TRUE(seen[0].error.has_value());
    EXPECT_EQ(*seen[0].error, "Not connected");
}

TEST(QueuePoller, PollsOnInterval) {
    auto fake = std::make_shared<FakeRemoteSession>();
    CommandSerializer serializer;
    serializer.attach(fake);

    QueuePoller poller(serializer, {"psts"}, 20ms);
    poller.start();
    ASSERT_TRUE(eventually([&] { return poller.rounds_completed() >= 3; }));
    poller.stop();
    EXPECT_FALSE(poller.running());

    // Nothing runs after stop.
    auto count = fake->count_prefix("lpq");
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(fake->count_prefix("lpq"), count);
}
