#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "lpr_helpers.hpp"

class CommandSerializer;

// Full lpq listing of one queue. Replaced wholesale every poll.
struct QueueSnapshot {
    std::string queue;
    std::vector<std::string> lines;
    std::string refreshed_at;
    std::optional<std::string> error;
};

// Lists every queue through the serializer on a fixed interval. One
// instance per connected session: built when the session comes up and
// destroyed on disconnect.
class QueuePoller {
public:
    using SnapshotCallback = std::function<void(const QueueSnapshot&)>;
    // Fired after a round for each queue whose listing succeeded. `seq` is
    // the serializer sequence number of the lpq command.
    using ListingCallback = std::function<void(const std::string& queue,
                                               const std::vector<LpqEntry>& entries,
                                               uint64_t seq)>;

    QueuePoller(CommandSerializer& serializer, std::vector<std::string> queues,
                std::chrono::milliseconds interval);
    ~QueuePoller();

    QueuePoller(const QueuePoller&) = delete;
    QueuePoller& operator=(const QueuePoller&) = delete;

    // Set before start().
    void set_snapshot_callback(SnapshotCallback cb) { on_snapshot_ = std::move(cb); }
    void set_listing_callback(ListingCallback cb) { on_listing_ = std::move(cb); }

    // First round runs immediately, then one per interval.
    void start();
    void stop();

    // Runs a round on the calling thread. Returns false without doing
    // anything when a round is already in flight.
    bool refresh_now();

    std::optional<QueueSnapshot> snapshot(const std::string& queue) const;
    std::vector<QueueSnapshot> snapshots() const;

    uint64_t rounds_completed() const { return rounds_completed_; }
    uint64_t ticks_skipped() const { return ticks_skipped_; }
    bool running() const { return running_; }

private:
    CommandSerializer& serializer_;
    std::vector<std::string> queues_;
    std::chrono::milliseconds interval_;

    SnapshotCallback on_snapshot_;
    ListingCallback on_listing_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_{false};
    std::atomic<bool> in_flight_{false};
    std::atomic<uint64_t> rounds_completed_{0};
    std::atomic<uint64_t> ticks_skipped_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread thread_;

    mutable std::mutex snapshots_mutex_;
    std::map<std::string, QueueSnapshot> snapshots_;

    void poll_loop();
    bool run_round();
};
