#pragma once

#include <chrono>
#include <memory>

namespace toolsrv {

// ---------------------------------------------------------------------------
// IClock: monotonic time source. Injected so that token refill and session
// expiry can be driven deterministically in tests.
// ---------------------------------------------------------------------------
class IClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SteadyClock : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override;
};

/// Process-wide steady clock instance.
std::shared_ptr<const IClock> DefaultClock();

} // namespace toolsrv
