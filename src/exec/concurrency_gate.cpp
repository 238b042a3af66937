#include <toolsrv/exec/concurrency_gate.hpp>

#include <algorithm>

namespace toolsrv {

ConcurrencyGate::ConcurrencyGate(std::size_t limit)
    : limit_(std::max<std::size_t>(limit, 1)) {}

Result<void, Error> ConcurrencyGate::Enter(const CancellationToken& cancel,
                                           std::optional<Deadline> deadline) {
    auto self = shared_from_this();
    auto registration = cancel.OnCancel([self] {
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    if (waiters_.empty() && in_flight_.load() < limit_) {
        ++in_flight_;
        return Result<void, Error>::Ok();
    }

    const auto ticket = next_ticket_++;
    waiters_.push_back(ticket);
    auto leave_queue = [this, ticket] {
        waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), ticket), waiters_.end());
        cv_.notify_all();
    };

    for (;;) {
        if (cancel.IsCancelled()) {
            leave_queue();
            return Result<void, Error>::Err(Error{
                "Enter", "cancelled while waiting for a concurrency slot",
                ErrorCategory::Cancelled, std::nullopt});
        }
        if (waiters_.front() == ticket && in_flight_.load() < limit_) {
            ++in_flight_;
            waiters_.pop_front();
            cv_.notify_all();
            return Result<void, Error>::Ok();
        }
        if (deadline.has_value()) {
            if (std::chrono::steady_clock::now() >= *deadline) {
                leave_queue();
                return Result<void, Error>::Err(Error{
                    "Enter", "admission deadline elapsed while waiting for a concurrency slot",
                    ErrorCategory::ExecutionTimeout, std::nullopt});
            }
            cv_.wait_until(lock, *deadline);
        } else {
            cv_.wait(lock);
        }
    }
}

void ConcurrencyGate::Leave() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_.load() > 0) {
            --in_flight_;
        }
    }
    cv_.notify_all();
}

void ConcurrencyGate::SetLimit(std::size_t limit) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limit_ = std::max<std::size_t>(limit, 1);
    }
    cv_.notify_all();
}

std::size_t ConcurrencyGate::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

std::size_t ConcurrencyGate::Limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

} // namespace toolsrv
