#include <toolsrv/exec/deadline_timer.hpp>

#include <toolsrv/core/log.hpp>

#include <exception>

namespace toolsrv {

DeadlineTimer::DeadlineTimer() : thread_([this] { Loop(); }) {}

DeadlineTimer::~DeadlineTimer() {
    Stop();
}

void DeadlineTimer::Schedule(TimePoint when, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        items_.push(Item{when, next_sequence_++, std::move(callback)});
    }
    cv_.notify_one();
}

void DeadlineTimer::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        items_ = decltype(items_)();
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::size_t DeadlineTimer::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

void DeadlineTimer::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (items_.empty()) {
            cv_.wait(lock);
            continue;
        }
        const auto when = items_.top().when;
        if (std::chrono::steady_clock::now() < when) {
            cv_.wait_until(lock, when);
            continue;
        }
        auto callback = std::move(const_cast<Item&>(items_.top()).callback);
        items_.pop();
        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            LogError("engine", std::string("deadline callback threw: ") + e.what());
        } catch (...) {
            LogError("engine", "deadline callback threw a non-standard exception");
        }
        lock.lock();
    }
}

} // namespace toolsrv
