#include <toolsrv/ratelimit/rate_limiter.hpp>

#include <toolsrv/core/log.hpp>

#include <algorithm>

namespace toolsrv {

namespace {

constexpr auto kMaxWaitSlice = std::chrono::milliseconds(25);
constexpr auto kMinWaitSlice = std::chrono::milliseconds(1);

Error LimiterError(const std::string& message, ErrorCategory category) {
    return Error{"Acquire", message, category, std::nullopt};
}

} // anonymous namespace

RateLimiter::RateLimiter(std::shared_ptr<const IClock> clock)
    : clock_(std::move(clock)) {}

void RateLimiter::Refill(Bucket& bucket) const {
    const auto now = clock_->Now();
    if (now <= bucket.last_refill) {
        return;
    }
    const std::chrono::duration<double> elapsed = now - bucket.last_refill;
    bucket.tokens = std::min(static_cast<double>(bucket.policy.capacity),
                             bucket.tokens + elapsed.count() * bucket.policy.refill_rate);
    bucket.last_refill = now;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::BucketFor(const ToolDescriptor& tool) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = buckets_.find(tool.name);
        if (it != buckets_.end() && tool.generation <= it->second.generation) {
            return it->second.bucket;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& entry = buckets_[tool.name];
    if (!entry.bucket) {
        auto bucket = std::make_shared<Bucket>();
        bucket->policy = tool.rate_limit;
        bucket->tokens = static_cast<double>(tool.rate_limit.capacity);
        bucket->last_refill = clock_->Now();
        entry.generation = tool.generation;
        entry.bucket = std::move(bucket);
        return entry.bucket;
    }

    // A descriptor from an older registration never rolls the policy back.
    if (tool.generation > entry.generation) {
        entry.generation = tool.generation;
        std::lock_guard<std::mutex> bucket_lock(entry.bucket->mutex);
        Refill(*entry.bucket);
        if (entry.bucket->policy != tool.rate_limit) {
            entry.bucket->policy = tool.rate_limit;
            entry.bucket->tokens = std::min(
                entry.bucket->tokens, static_cast<double>(tool.rate_limit.capacity));
            LogInfo("ratelimit", "policy of " + tool.name + " updated for version " +
                                     tool.version);
        }
        entry.bucket->cv.notify_all();
    }
    return entry.bucket;
}

Result<void, Error> RateLimiter::Acquire(const ToolDescriptor& tool,
                                         const CancellationToken& cancel,
                                         std::optional<Deadline> deadline) {
    auto bucket = BucketFor(tool);

    // Registered before the bucket lock is taken: the callback runs inline
    // when the token is already cancelled.
    auto registration = cancel.OnCancel([bucket] {
        std::lock_guard<std::mutex> lock(bucket->mutex);
        bucket->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(bucket->mutex);
    Refill(*bucket);

    if (bucket->waiters.empty() && bucket->tokens >= 1.0) {
        bucket->tokens -= 1.0;
        return Result<void, Error>::Ok();
    }

    if (bucket->policy.mode == AdmissionMode::Reject) {
        return Result<void, Error>::Err(LimiterError(
            "rate limit exceeded for tool '" + tool.name + "'",
            ErrorCategory::RateLimitExceeded));
    }

    if (bucket->waiters.size() >= bucket->policy.queue_depth) {
        return Result<void, Error>::Err(LimiterError(
            "admission queue of tool '" + tool.name + "' is full",
            ErrorCategory::RateLimitExceeded));
    }

    const auto ticket = bucket->next_ticket++;
    bucket->waiters.push_back(ticket);

    auto leave_queue = [&bucket, ticket] {
        auto& waiters = bucket->waiters;
        waiters.erase(std::remove(waiters.begin(), waiters.end(), ticket), waiters.end());
        bucket->cv.notify_all();
    };

    for (;;) {
        if (cancel.IsCancelled()) {
            leave_queue();
            return Result<void, Error>::Err(LimiterError(
                "cancelled while waiting for a token of '" + tool.name + "'",
                ErrorCategory::Cancelled));
        }

        Refill(*bucket);
        const bool at_head = bucket->waiters.front() == ticket;
        if (at_head && bucket->tokens >= 1.0) {
            bucket->tokens -= 1.0;
            bucket->waiters.pop_front();
            bucket->cv.notify_all();
            return Result<void, Error>::Ok();
        }

        const auto now = std::chrono::steady_clock::now();
        if (deadline.has_value() && now >= *deadline) {
            leave_queue();
            return Result<void, Error>::Err(LimiterError(
                "admission deadline elapsed while queued for '" + tool.name + "'",
                ErrorCategory::ExecutionTimeout));
        }

        std::chrono::steady_clock::duration wait = kMaxWaitSlice;
        if (at_head) {
            const std::chrono::duration<double> to_next_token(
                (1.0 - bucket->tokens) / bucket->policy.refill_rate);
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                      to_next_token));
        }
        if (deadline.has_value()) {
            wait = std::min(wait, *deadline - now);
        }
        wait = std::max<std::chrono::steady_clock::duration>(wait, kMinWaitSlice);
        bucket->cv.wait_for(lock, wait);
    }
}

std::optional<double> RateLimiter::Tokens(std::string_view tool) const {
    std::shared_ptr<Bucket> bucket;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = buckets_.find(tool);
        if (it == buckets_.end()) {
            return std::nullopt;
        }
        bucket = it->second.bucket;
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    Refill(*bucket);
    return bucket->tokens;
}

std::size_t RateLimiter::QueueLength(std::string_view tool) const {
    std::shared_ptr<Bucket> bucket;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = buckets_.find(tool);
        if (it == buckets_.end()) {
            return 0;
        }
        bucket = it->second.bucket;
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    return bucket->waiters.size();
}

void RateLimiter::Remove(std::string_view tool) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = buckets_.find(tool);
    if (it != buckets_.end()) {
        buckets_.erase(it);
    }
}

} // namespace toolsrv
