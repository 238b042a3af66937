#pragma once

#include <toolsrv/core/clock.hpp>

#include <chrono>
#include <mutex>

namespace toolsrv {
namespace testing {

// ---------------------------------------------------------------------------
// ManualClock: IClock that only moves when told to.
//
// Usage:
//   auto clock = std::make_shared<ManualClock>();
//   RateLimiter limiter(clock);
//   clock->Advance(std::chrono::seconds(1));
// ---------------------------------------------------------------------------
class ManualClock : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    template <typename Rep, typename Period>
    void Advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(delta);
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_ = TimePoint{} + std::chrono::hours(1);
};

} // namespace testing
} // namespace toolsrv
