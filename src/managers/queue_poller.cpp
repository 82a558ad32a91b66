#include "queue_poller.hpp"
#include "command_serializer.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

QueuePoller::QueuePoller(CommandSerializer& serializer, std::vector<std::string> queues,
                         std::chrono::milliseconds interval)
    : serializer_(serializer), queues_(std::move(queues)), interval_(interval) {
    if (interval_.count() <= 0) interval_ = std::chrono::milliseconds(1000);
}

QueuePoller::~QueuePoller() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void QueuePoller::start() {
    if (running_) return;
    stop_ = false;
    running_ = true;
    thread_ = std::thread(&QueuePoller::poll_loop, this);
    socprint_log(fmt::format("poller: started ({} queues, every {}ms)",
                             queues_.size(), interval_.count()));
}

void QueuePoller::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_ = true;
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    socprint_log("poller: stopped");
}

bool QueuePoller::refresh_now() {
    if (stop_) return false;
    return run_round();
}

// ── Poll loop ───────────────────────────────────────────────

void QueuePoller::poll_loop() {
    auto next_tick = std::chrono::steady_clock::now();
    while (!stop_) {
        if (!run_round()) {
            // A manual refresh owns this tick
            ++ticks_skipped_;
        }

        next_tick += interval_;
        auto now = std::chrono::steady_clock::now();
        while (next_tick <= now) {
            // Round overran the interval: drop the missed ticks
            next_tick += interval_;
            ++ticks_skipped_;
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_until(lock, next_tick, [this] { return stop_.load(); });
    }
}

bool QueuePoller::run_round() {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        return false;
    }

    struct Listed {
        std::string queue;
        std::vector<LpqEntry> entries;
        uint64_t seq;
    };
    std::vector<Listed> listed;

    for (const auto& queue : queues_) {
        if (stop_) break;

        uint64_t seq = 0;
        auto result = serializer_.execute(lpq_command(queue), &seq);

        QueueSnapshot snap;
        snap.queue = queue;
        snap.refreshed_at = now_iso();
        if (result.is_ok()) {
            snap.lines = split_lines(result.value);
            listed.push_back({queue, parse_lpq_output(snap.lines), seq});
        } else {
            snap.error = result.error;
            socprint_log(fmt::format("poller: {} failed: {}", queue, result.error));
        }

        {
            std::lock_guard<std::mutex> lock(snapshots_mutex_);
            snapshots_[queue] = snap;
        }
        if (on_snapshot_) on_snapshot_(snap);
    }

    if (on_listing_) {
        for (const auto& l : listed) {
            on_listing_(l.queue, l.entries, l.seq);
        }
    }

    ++rounds_completed_;
    in_flight_ = false;
    return true;
}

std::optional<QueueSnapshot> QueuePoller::snapshot(const std::string& queue) const {
    std::lock_guard<std::mutex> lock(snapshots_mutex_);
    auto it = snapshots_.find(queue);
    if (it == snapshots_.end()) return std::nullopt;
    return it->second;
}

std::vector<QueueSnapshot> QueuePoller::snapshots() const {
    std::lock_guard<std::mutex> lock(snapshots_mutex_);
    std::vector<QueueSnapshot> out;
    for (const auto& q : queues_) {
        auto it = snapshots_.find(q);
        if (it != snapshots_.end()) out.push_back(it->second);
    }
    return out;
}
