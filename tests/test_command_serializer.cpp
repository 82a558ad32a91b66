#include <gtest/gtest.h>
#include <managers/command_serializer.hpp>
#include "fake_remote_session.hpp"
#include <atomic>
#include <thread>

TEST(CommandSerializer, NotConnectedWithoutSession) {
    CommandSerializer s;
    auto r = s.execute("lpq -P psts");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotConnected);
    EXPECT_EQ(s.upload("/tmp/x", "/tmp/y").kind, ErrorKind::NotConnected);
}

TEST(CommandSerializer, ReturnsOutputOnSuccess) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->on("echo", 0, "hello");
    CommandSerializer s;
    s.attach(fake);

    uint64_t seq = 0;
    auto r = s.execute("echo hello", &seq);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "hello");
    EXPECT_GT(seq, 0u);
    EXPECT_EQ(s.last_seq(), seq);
}

TEST(CommandSerializer, NonZeroExitIsRemoteCommandWithRawOutput) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->on("lpr", 1, "lpr: The printer or class does not exist.");
    fake->on("false", 2, "");
    CommandSerializer s;
    s.attach(fake);

    auto r = s.execute("lpr -P nope f");
    EXPECT_EQ(r.kind, ErrorKind::RemoteCommand);
    EXPECT_EQ(r.error, "lpr: The printer or class does not exist.");
    EXPECT_EQ(s.execute("false").error, "exit status 2");
}

TEST(CommandSerializer, RunsOneAtATimeInArrivalOrder) {
    auto fake = std::make_shared<FakeRemoteSession>();
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    fake->on("cmd", [&](const std::string&) {
        int now = ++running;
        int prev = max_running.load();
        while (now > prev && !max_running.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --running;
        return SSHResult{0, "", ""};
    });
    fake->hold("first");

    CommandSerializer s;
    s.attach(fake);

    std::thread a([&] { s.execute("first"); });
    ASSERT_TRUE(fake->wait_until_held());
    std::thread b([&] { s.execute("cmd b"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::thread c([&] { s.execute("cmd c"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    fake->release();
    a.join();
    b.join();
    c.join();

    auto cmds = fake->commands();
    ASSERT_EQ(cmds.size(), 3u);
    EXPECT_EQ(cmds[0], "first");
    EXPECT_EQ(cmds[1], "cmd b");
    EXPECT_EQ(cmds[2], "cmd c");
    EXPECT_EQ(max_running.load(), 1);
}

TEST(CommandSerializer, DetachFailsQueuedTasks) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->hold("slow");
    CommandSerializer s;
    s.attach(fake);

    Result<std::string> slow = Result<std::string>::Ok("");
    Result<std::string> queued = Result<std::string>::Ok("");
    std::thread a([&] { slow = s.execute("slow"); });
    ASSERT_TRUE(fake->wait_until_held());
    std::thread b([&] { queued = s.execute("queued"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    s.detach();
    b.join();
    EXPECT_EQ(queued.kind, ErrorKind::NotConnected);

    // The task already running finishes against its own session.
    fake->release();
    a.join();
    EXPECT_TRUE(slow.is_ok());
    EXPECT_FALSE(s.attached());
    EXPECT_EQ(fake->count_prefix("queued"), 0);
}

TEST(CommandSerializer, TransportFailureReportsSessionLost) {
    auto fake = std::make_shared<FakeRemoteSession>();
    fake->drop_on("lpq");
    CommandSerializer s;
    s.attach(fake);

    std::atomic<bool> lost{false};
    std::string reason;
    s.set_session_lost_callback([&](const std::shared_ptr<RemoteSession>& session,
                                    const std::string& why) {
        EXPECT_EQ(session.get(), fake.get());
        reason = why;
        lost = true;
    });

    auto r = s.execute("lpq -P psts");
    EXPECT_EQ(r.kind, ErrorKind::Connection);
    ASSERT_TRUE(eventually([&] { return lost.load(); }));
    EXPECT_EQ(reason, "Channel closed");
}

TEST(CommandSerializer, UploadGoesThroughQueue) {
    auto fake = std::make_shared<FakeRemoteSession>();
    CommandSerializer s;
    s.attach(fake);
    ASSERT_TRUE(s.upload("/tmp/a.pdf", "/tmp/j1.pdf").is_ok());
    EXPECT_EQ(fake->uploads(), std::vector<std::string>{"/tmp/j1.pdf"});

    fake->fail_uploads("No space left on device");
    auto r = s.upload("/tmp/a.pdf", "/tmp/j2.pdf");
    EXPECT_EQ(r.kind, ErrorKind::RemoteCommand);
    EXPECT_EQ(r.error, "No space left on device");
}
