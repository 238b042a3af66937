#pragma once

#include <toolsrv/core/cancellation.hpp>
#include <toolsrv/core/result.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace toolsrv {

// ---------------------------------------------------------------------------
// ConcurrencyGate: bounds the number of callers inside a section. Waiters
// enter in strict arrival order. Must be owned by a std::shared_ptr.
// ---------------------------------------------------------------------------
class ConcurrencyGate : public std::enable_shared_from_this<ConcurrencyGate> {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    explicit ConcurrencyGate(std::size_t limit);

    // Cancelled if the token fires while waiting, ExecutionTimeout if the
    // deadline passes first.
    Result<void, Error> Enter(const CancellationToken& cancel = {},
                              std::optional<Deadline> deadline = std::nullopt);
    void Leave();

    void SetLimit(std::size_t limit);

    [[nodiscard]] std::size_t InFlight() const noexcept { return in_flight_.load(); }
    [[nodiscard]] std::size_t Waiting() const;
    [[nodiscard]] std::size_t Limit() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t limit_;
    std::atomic<std::size_t> in_flight_{0};
    std::deque<std::uint64_t> waiters_;
    std::uint64_t next_ticket_ = 1;
};

} // namespace toolsrv
