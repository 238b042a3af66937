#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace toolsrv {

namespace detail {
struct CancelState;
} // namespace detail

// ---------------------------------------------------------------------------
// CallbackRegistration: RAII handle for a cancellation callback. The
// callback is unregistered when the handle is destroyed or reset.
// ---------------------------------------------------------------------------
class CallbackRegistration {
public:
    CallbackRegistration() = default;
    CallbackRegistration(std::weak_ptr<detail::CancelState> state, std::uint64_t id);
    ~CallbackRegistration();

    CallbackRegistration(CallbackRegistration&& other) noexcept;
    CallbackRegistration& operator=(CallbackRegistration&& other) noexcept;
    CallbackRegistration(const CallbackRegistration&) = delete;
    CallbackRegistration& operator=(const CallbackRegistration&) = delete;

    void Reset();

private:
    std::weak_ptr<detail::CancelState> state_;
    std::uint64_t id_ = 0;
};

// ---------------------------------------------------------------------------
// CancellationToken: read side of a cancellation signal. Copyable. A
// default-constructed token is never cancelled.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool IsCancelled() const;

    // Runs `callback` when the source is cancelled, or immediately on the
    // calling thread when it already is. The callback must not block.
    [[nodiscard]] CallbackRegistration OnCancel(std::function<void()> callback) const;

    // Sleeps up to `duration`. Returns true if cancelled before or during
    // the wait.
    bool WaitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> state);

    std::shared_ptr<detail::CancelState> state_;
};

// ---------------------------------------------------------------------------
// CancellationSource: write side. Cancel() is idempotent.
// ---------------------------------------------------------------------------
class CancellationSource {
public:
    CancellationSource();

    void Cancel();
    [[nodiscard]] bool IsCancelled() const;
    [[nodiscard]] CancellationToken Token() const;

private:
    std::shared_ptr<detail::CancelState> state_;
};

} // namespace toolsrv
