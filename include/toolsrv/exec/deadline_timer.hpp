#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace toolsrv {

// ---------------------------------------------------------------------------
// DeadlineTimer: one thread firing callbacks at absolute steady-clock
// deadlines, earliest first. Callbacks run on the timer thread and must be
// short. Stop() discards pending callbacks.
// ---------------------------------------------------------------------------
class DeadlineTimer {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Callback = std::function<void()>;

    DeadlineTimer();
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    void Schedule(TimePoint when, Callback callback);
    void Stop();

    [[nodiscard]] std::size_t Pending() const;

private:
    struct Item {
        TimePoint when;
        std::uint64_t sequence;
        Callback callback;
    };
    struct Later {
        bool operator()(const Item& a, const Item& b) const {
            if (a.when != b.when) return a.when > b.when;
            return a.sequence > b.sequence;
        }
    };

    void Loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Later> items_;
    std::uint64_t next_sequence_ = 0;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace toolsrv
