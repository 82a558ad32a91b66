#include <gtest/gtest.h>
#include <managers/command_serializer.hpp>
#include <managers/session_lifecycle.hpp>
#include "fake_remote_session.hpp"
#include <algorithm>
#include <mutex>
#include <thread>

namespace {

RetryPolicy fast_policy(int attempts = 3) {
    RetryPolicy p;
    p.attempts = attempts;
    p.backoff_ms = 5;
    p.tick_ms = 20;
    return p;
}

ConnectionConfig target() {
    ConnectionConfig c;
    c.host = "printhost";
    c.user = "alice";
    c.secret = "pw";
    return c;
}

// Records every published status name.
struct StatusLog {
    std::mutex mutex;
    std::vector<std::string> names;

    SessionLifecycle::StatusListener listener() {
        return [this](const ConnectionStatus& s) {
            std::lock_guard<std::mutex> lock(mutex);
            names.push_back(status_name(s));
        };
    }

    std::vector<std::string> get() {
        std::lock_guard<std::mutex> lock(mutex);
        return names;
    }
};

} // namespace

TEST(SessionLifecycle, StartsDisconnected) {
    CommandSerializer serializer;
    FakeOpener fake;
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());
    EXPECT_TRUE(std::holds_alternative<Disconnected>(lc.status()));
    EXPECT_FALSE(lc.is_connected());
}

TEST(SessionLifecycle, ConnectPublishesConnectingThenConnected) {
    CommandSerializer serializer;
    FakeOpener fake;
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());
    StatusLog log;
    lc.add_status_listener(log.listener());

    auto r = lc.connect(target());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(lc.is_connected());
    EXPECT_TRUE(serializer.attached());

    auto names = log.get();
    ASSERT_GE(names.size(), 2u);
    EXPECT_EQ(names.front(), "connecting");
    EXPECT_EQ(names.back(), "connected");
}

TEST(SessionLifecycle, RetriesBeforeSucceeding) {
    CommandSerializer serializer;
    FakeOpener fake;
    fake.failures_before_success = 2;
    SessionLifecycle lc(serializer, fake.opener(), fast_policy(3));

    std::vector<std::string> progress;
    auto r = lc.connect(target(), [&](const std::string& m) { progress.push_back(m); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(fake.calls.load(), 3);
    EXPECT_FALSE(progress.empty());
}

TEST(SessionLifecycle, ExhaustedRetriesEndInFailed) {
    CommandSerializer serializer;
    FakeOpener fake;
    fake.failures_before_success = 100;
    fake.failure_message = "Authentication failed";
    SessionLifecycle lc(serializer, fake.opener(), fast_policy(2));

    auto r = lc.connect(target());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
    EXPECT_EQ(fake.calls.load(), 2);

    auto status = lc.status();
    auto* failed = std::get_if<Failed>(&status);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->message, "Authentication failed");
    EXPECT_FALSE(failed->last_attempt_at.empty());
    EXPECT_FALSE(serializer.attached());
}

TEST(SessionLifecycle, SecondConnectWhileConnectingIsRejected) {
    CommandSerializer serializer;
    FakeOpener fake;
    fake.delay = std::chrono::milliseconds(300);
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());

    std::thread first([&] { lc.connect(target()); });
    ASSERT_TRUE(eventually([&] { return std::holds_alternative<Connecting>(lc.status()); }));

    auto second = lc.connect(target());
    EXPECT_EQ(second.kind, ErrorKind::AlreadyConnecting);
    first.join();
    EXPECT_TRUE(lc.is_connected());
    EXPECT_EQ(fake.calls.load(), 1);
}

TEST(SessionLifecycle, ConnectingElapsedTicks) {
    CommandSerializer serializer;
    FakeOpener fake;
    fake.delay = std::chrono::milliseconds(150);
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());

    std::mutex m;
    int max_elapsed = 0;
    lc.add_status_listener([&](const ConnectionStatus& s) {
        if (auto* c = std::get_if<Connecting>(&s)) {
            std::lock_guard<std::mutex> lock(m);
            max_elapsed = std::max(max_elapsed, c->elapsed_seconds);
        }
    });
    ASSERT_TRUE(lc.connect(target()).is_ok());
    std::lock_guard<std::mutex> lock(m);
    EXPECT_GE(max_elapsed, 1);
}

TEST(SessionLifecycle, DisconnectIsIdempotent) {
    CommandSerializer serializer;
    FakeOpener fake;
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());
    StatusLog log;
    lc.add_status_listener(log.listener());

    EXPECT_TRUE(lc.disconnect().is_ok());
    EXPECT_TRUE(log.get().empty());

    ASSERT_TRUE(lc.connect(target()).is_ok());
    EXPECT_TRUE(lc.disconnect().is_ok());
    EXPECT_TRUE(lc.disconnect().is_ok());

    EXPECT_TRUE(fake.session->closed());
    EXPECT_FALSE(serializer.attached());
    auto names = log.get();
    EXPECT_EQ(names.back(), "disconnected");
    EXPECT_EQ(std::count(names.begin(), names.end(), "disconnected"), 1);
}

TEST(SessionLifecycle, DisconnectAbortsAttemptInProgress) {
    CommandSerializer serializer;
    FakeOpener fake;
    fake.delay = std::chrono::milliseconds(200);
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());

    Result<void> result = Result<void>::Ok();
    std::thread t([&] { result = lc.connect(target()); });
    ASSERT_TRUE(eventually([&] { return std::holds_alternative<Connecting>(lc.status()); }));
    lc.disconnect();
    t.join();

    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(std::holds_alternative<Disconnected>(lc.status()));
    EXPECT_FALSE(serializer.attached());
    // The session the opener produced after the abort is not leaked open.
    EXPECT_TRUE(fake.session->closed());
}

TEST(SessionLifecycle, AbortedAttemptBlocksConnectUntilOpenerReturns) {
    CommandSerializer serializer;
    FakeOpener fake;
    fake.delay = std::chrono::milliseconds(300);
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());

    std::thread t([&] { lc.connect(target()); });
    ASSERT_TRUE(eventually([&] { return std::holds_alternative<Connecting>(lc.status()); }));
    lc.disconnect();
    EXPECT_TRUE(std::holds_alternative<Disconnected>(lc.status()));

    // The opener is still running for the aborted attempt
    EXPECT_EQ(lc.connect(target()).kind, ErrorKind::AlreadyConnecting);
    t.join();

    fake.session = std::make_shared<FakeRemoteSession>();
    fake.delay = std::chrono::milliseconds(0);
    ASSERT_TRUE(lc.connect(target()).is_ok());
    EXPECT_TRUE(lc.is_connected());
}

TEST(SessionLifecycle, ReconnectReplacesSession) {
    CommandSerializer serializer;
    FakeOpener fake;
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());
    ASSERT_TRUE(lc.connect(target()).is_ok());
    auto first = fake.session;

    fake.session = std::make_shared<FakeRemoteSession>();
    ASSERT_TRUE(lc.connect(target()).is_ok());
    EXPECT_TRUE(first->closed());
    EXPECT_FALSE(fake.session->closed());
}

TEST(SessionLifecycle, LostSessionBecomesFailed) {
    CommandSerializer serializer;
    FakeOpener fake;
    fake.session->drop_on("lpq");
    SessionLifecycle lc(serializer, fake.opener(), fast_policy());
    ASSERT_TRUE(lc.connect(target()).is_ok());

    auto r = serializer.execute("lpq -P psts");
    EXPECT_EQ(r.kind, ErrorKind::Connection);

    ASSERT_TRUE(eventually([&] { return std::holds_alternative<Failed>(lc.status()); }));
    auto status = lc.status();
    EXPECT_NE(std::get<Failed>(status).message.find("Connection lost"), std::string::npos);
    EXPECT_FALSE(serializer.attached());
    EXPECT_EQ(serializer.execute("lpq -P psts").kind, ErrorKind::NotConnected);
}
