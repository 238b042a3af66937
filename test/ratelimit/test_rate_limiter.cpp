#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <toolsrv/ratelimit/rate_limiter.hpp>

#include "mocks/manual_clock.hpp"
#include "mocks/test_tools.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace toolsrv;
using namespace toolsrv::testing;
using namespace std::chrono_literals;

namespace {

ToolDescriptor LimitedTool(std::size_t capacity, double rate,
                           AdmissionMode mode = AdmissionMode::Reject,
                           std::size_t queue_depth = 0) {
    auto tool = MakeTestTool("limited", EchoHandler(), capacity, rate);
    tool.rate_limit.mode = mode;
    tool.rate_limit.queue_depth = queue_depth;
    return tool;
}

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = 5s) {
    const auto end = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < end) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

} // anonymous namespace

// ===========================================================================
// Reject mode
// ===========================================================================

TEST_CASE("RateLimiter: burst up to capacity then reject", "[ratelimit]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(5, 1.0);

    for (int i = 0; i < 5; ++i) {
        REQUIRE(limiter.Acquire(tool).IsOk());
    }
    auto sixth = limiter.Acquire(tool);
    REQUIRE(sixth.IsErr());
    CHECK(sixth.Error().category == ErrorCategory::RateLimitExceeded);

    clock->Advance(1s);
    CHECK(limiter.Acquire(tool).IsOk());
    CHECK(limiter.Acquire(tool).IsErr());
}

TEST_CASE("RateLimiter: tokens never exceed capacity", "[ratelimit]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(3, 10.0);

    CHECK_FALSE(limiter.Tokens("limited").has_value());
    REQUIRE(limiter.Acquire(tool).IsOk());
    clock->Advance(1h);
    REQUIRE(limiter.Tokens("limited").has_value());
    CHECK_THAT(*limiter.Tokens("limited"), Catch::Matchers::WithinAbs(3.0, 1e-9));
}

TEST_CASE("RateLimiter: fractional refill", "[ratelimit]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(1, 2.0);

    REQUIRE(limiter.Acquire(tool).IsOk());
    clock->Advance(250ms);
    CHECK_THAT(*limiter.Tokens("limited"), Catch::Matchers::WithinAbs(0.5, 1e-9));
    CHECK(limiter.Acquire(tool).IsErr());
    clock->Advance(250ms);
    CHECK(limiter.Acquire(tool).IsOk());
}

TEST_CASE("RateLimiter: buckets are per tool", "[ratelimit]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto a = LimitedTool(1, 1.0);
    auto b = LimitedTool(1, 1.0);
    b.name = "other";

    REQUIRE(limiter.Acquire(a).IsOk());
    CHECK(limiter.Acquire(a).IsErr());
    CHECK(limiter.Acquire(b).IsOk());
}

TEST_CASE("RateLimiter: new version updates the policy in place", "[ratelimit]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto v1 = LimitedTool(5, 1.0);
    v1.generation = 1;
    REQUIRE(limiter.Acquire(v1).IsOk());
    CHECK_THAT(*limiter.Tokens("limited"), Catch::Matchers::WithinAbs(4.0, 1e-9));

    auto v2 = LimitedTool(2, 1.0);
    v2.version = "2.0.0";
    v2.generation = 2;
    REQUIRE(limiter.Acquire(v2).IsOk());
    CHECK_THAT(*limiter.Tokens("limited"), Catch::Matchers::WithinAbs(1.0, 1e-9));
}

TEST_CASE("RateLimiter: descriptor from an older registration keeps the newer policy",
          "[ratelimit]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto v1 = LimitedTool(2, 1.0);
    v1.generation = 1;
    auto v2 = LimitedTool(100, 1.0);
    v2.version = "2.0.0";
    v2.generation = 2;

    REQUIRE(limiter.Acquire(v2).IsOk());
    CHECK_THAT(*limiter.Tokens("limited"), Catch::Matchers::WithinAbs(99.0, 1e-9));

    // A caller still holding the old descriptor must not clamp to capacity 2.
    REQUIRE(limiter.Acquire(v1).IsOk());
    CHECK_THAT(*limiter.Tokens("limited"), Catch::Matchers::WithinAbs(98.0, 1e-9));

    for (int i = 0; i < 10; ++i) {
        REQUIRE(limiter.Acquire(i % 2 == 0 ? v1 : v2).IsOk());
    }
    CHECK_THAT(*limiter.Tokens("limited"), Catch::Matchers::WithinAbs(88.0, 1e-9));
}

// ===========================================================================
// Queue mode
// ===========================================================================

TEST_CASE("RateLimiter: queued callers are admitted in arrival order", "[ratelimit][queue]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(1, 1.0, AdmissionMode::Queue, 3);
    REQUIRE(limiter.Acquire(tool).IsOk());

    std::mutex mutex;
    std::vector<int> admitted;
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&, i] {
            auto r = limiter.Acquire(tool);
            std::lock_guard<std::mutex> lock(mutex);
            admitted.push_back(r.IsOk() ? i : -1);
        });
        REQUIRE(WaitUntil([&] { return limiter.QueueLength("limited") == std::size_t(i + 1); }));
    }

    for (int i = 0; i < 3; ++i) {
        clock->Advance(1s);
        REQUIRE(WaitUntil([&] {
            std::lock_guard<std::mutex> lock(mutex);
            return admitted.size() == std::size_t(i + 1);
        }));
    }
    for (auto& t : waiters) {
        t.join();
    }
    CHECK(admitted == std::vector<int>{0, 1, 2});
    CHECK(limiter.QueueLength("limited") == 0);
}

TEST_CASE("RateLimiter: newcomer does not overtake a queued caller", "[ratelimit][queue]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(1, 1.0, AdmissionMode::Queue, 2);
    REQUIRE(limiter.Acquire(tool).IsOk());

    std::atomic<bool> first_done{false};
    std::atomic<bool> first_ok{false};
    std::thread first([&] {
        first_ok = limiter.Acquire(tool).IsOk();
        first_done = true;
    });
    REQUIRE(WaitUntil([&] { return limiter.QueueLength("limited") == 1; }));

    CancellationSource second_cancel;
    std::atomic<bool> second_ok{false};
    std::thread second([&] {
        second_ok = limiter.Acquire(tool, second_cancel.Token()).IsOk();
    });
    REQUIRE(WaitUntil([&] { return limiter.QueueLength("limited") == 2; }));

    clock->Advance(1s);
    REQUIRE(WaitUntil([&] { return first_done.load(); }));
    CHECK(limiter.QueueLength("limited") == 1);

    second_cancel.Cancel();
    first.join();
    second.join();
    CHECK(first_ok);
    CHECK_FALSE(second_ok);
}

TEST_CASE("RateLimiter: full queue rejects", "[ratelimit][queue]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(1, 1.0, AdmissionMode::Queue, 1);
    REQUIRE(limiter.Acquire(tool).IsOk());

    CancellationSource cancel;
    Result<void, Error> queued = Result<void, Error>::Ok();
    std::thread waiter([&] { queued = limiter.Acquire(tool, cancel.Token()); });
    REQUIRE(WaitUntil([&] { return limiter.QueueLength("limited") == 1; }));

    auto overflow = limiter.Acquire(tool);
    REQUIRE(overflow.IsErr());
    CHECK(overflow.Error().category == ErrorCategory::RateLimitExceeded);

    cancel.Cancel();
    waiter.join();
    REQUIRE(queued.IsErr());
    CHECK(queued.Error().category == ErrorCategory::Cancelled);
    CHECK(limiter.QueueLength("limited") == 0);
}

TEST_CASE("RateLimiter: already cancelled caller never waits", "[ratelimit][queue]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(1, 1.0, AdmissionMode::Queue, 4);
    REQUIRE(limiter.Acquire(tool).IsOk());

    CancellationSource cancel;
    cancel.Cancel();
    auto r = limiter.Acquire(tool, cancel.Token());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Cancelled);
    CHECK(limiter.QueueLength("limited") == 0);
}

TEST_CASE("RateLimiter: admission deadline elapses while queued", "[ratelimit][queue]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(1, 1.0, AdmissionMode::Queue, 4);
    REQUIRE(limiter.Acquire(tool).IsOk());

    const auto start = std::chrono::steady_clock::now();
    auto r = limiter.Acquire(tool, {}, start + 50ms);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ExecutionTimeout);
    CHECK(std::chrono::steady_clock::now() - start >= 50ms);
    CHECK(limiter.QueueLength("limited") == 0);
}

TEST_CASE("RateLimiter: Remove drops the bucket", "[ratelimit]") {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(clock);
    auto tool = LimitedTool(1, 1.0);
    REQUIRE(limiter.Acquire(tool).IsOk());
    limiter.Remove("limited");
    CHECK_FALSE(limiter.Tokens("limited").has_value());
    CHECK(limiter.Acquire(tool).IsOk());
}
