#include <toolsrv/core/clock.hpp>

namespace toolsrv {

IClock::TimePoint SteadyClock::Now() const {
    return std::chrono::steady_clock::now();
}

std::shared_ptr<const IClock> DefaultClock() {
    static const auto instance = std::make_shared<const SteadyClock>();
    return instance;
}

} // namespace toolsrv
