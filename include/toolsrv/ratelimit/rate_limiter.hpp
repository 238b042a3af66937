#pragma once

#include <toolsrv/core/cancellation.hpp>
#include <toolsrv/core/clock.hpp>
#include <toolsrv/core/result.hpp>
#include <toolsrv/registry/tool_descriptor.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace toolsrv {

// ---------------------------------------------------------------------------
// RateLimiter: one token bucket per tool.
//
// Buckets are created lazily from the descriptor's policy and updated in
// place when a descriptor from a newer registration (larger generation)
// changes the policy. Stale descriptors never roll it back. Tokens are read
// from the injected clock; waiting callers re-check at least every 25 ms.
//
// In queue mode only the head of a tool's waiter queue may take a token, so
// waiters are admitted in arrival order and newcomers never overtake them.
// ---------------------------------------------------------------------------
class RateLimiter {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    explicit RateLimiter(std::shared_ptr<const IClock> clock = DefaultClock());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // RateLimitExceeded (reject mode or full queue), Cancelled (cancel token
    // fired while queued) or ExecutionTimeout (deadline, real time, elapsed
    // while queued).
    Result<void, Error> Acquire(const ToolDescriptor& tool,
                                const CancellationToken& cancel = {},
                                std::optional<Deadline> deadline = std::nullopt);

    // Current token count after refill; nullopt if no bucket exists yet.
    [[nodiscard]] std::optional<double> Tokens(std::string_view tool) const;
    [[nodiscard]] std::size_t QueueLength(std::string_view tool) const;
    void Remove(std::string_view tool);

private:
    struct Bucket {
        std::mutex mutex;
        std::condition_variable cv;
        RateLimitPolicy policy;
        double tokens = 0.0;
        IClock::TimePoint last_refill;
        std::deque<std::uint64_t> waiters;
        std::uint64_t next_ticket = 1;
    };

    struct Entry {
        std::uint64_t generation = 0;
        std::shared_ptr<Bucket> bucket;
    };

    std::shared_ptr<Bucket> BucketFor(const ToolDescriptor& tool);
    void Refill(Bucket& bucket) const;

    std::shared_ptr<const IClock> clock_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry, std::less<>> buckets_;
};

} // namespace toolsrv
