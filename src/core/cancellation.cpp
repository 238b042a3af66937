#include <toolsrv/core/cancellation.hpp>

#include <thread>
#include <vector>

namespace toolsrv {

namespace detail {

struct CancelState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

// ---------------------------------------------------------------------------
// CallbackRegistration
// ---------------------------------------------------------------------------
CallbackRegistration::CallbackRegistration(
    std::weak_ptr<detail::CancelState> state, std::uint64_t id)
    : state_(std::move(state)), id_(id) {}

CallbackRegistration::~CallbackRegistration() {
    Reset();
}

CallbackRegistration::CallbackRegistration(CallbackRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CallbackRegistration& CallbackRegistration::operator=(
    CallbackRegistration&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CallbackRegistration::Reset() {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------
CancellationToken::CancellationToken(std::shared_ptr<detail::CancelState> state)
    : state_(std::move(state)) {}

bool CancellationToken::IsCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CallbackRegistration CancellationToken::OnCancel(
    std::function<void()> callback) const {
    if (!state_) {
        return {};
    }
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
        }
    }
    if (id == 0) {
        callback();
        return {};
    }
    return CallbackRegistration(state_, id);
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration,
                               [this] { return state_->cancelled; });
}

// ---------------------------------------------------------------------------
// CancellationSource
// ---------------------------------------------------------------------------
CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

void CancellationSource::Cancel() {
    std::map<std::uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    for (auto& [id, callback] : callbacks) {
        callback();
    }
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

} // namespace toolsrv
