#include <toolsrv/events/event_publisher.hpp>

#include <toolsrv/core/log.hpp>

#include <algorithm>
#include <vector>

namespace toolsrv {

namespace detail {

struct EventChannel {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Event> buffer;
    std::uint64_t next_sequence = 1;
    std::uint64_t generation = 0;
    bool attached = false;
    bool ever_subscribed = false;
    bool closed = false;
    std::chrono::steady_clock::time_point last_activity = std::chrono::steady_clock::now();
};

} // namespace detail

namespace {

std::int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Caller holds the channel mutex. Folds the oldest events into a single
// marker at the head until the buffer fits.
void Trim(detail::EventChannel& channel, std::size_t capacity) {
    auto& buffer = channel.buffer;
    while (buffer.size() > capacity) {
        auto& head = buffer.front();
        if (head.kind != EventKind::EventsDropped) {
            const auto sequence = head.sequence;
            head.kind = EventKind::EventsDropped;
            head.payload = {{"dropped", 1},
                            {"first_sequence", sequence},
                            {"last_sequence", sequence}};
            continue;
        }
        const auto& dropped = buffer[1];
        head.payload["dropped"] = head.payload["dropped"].get<std::uint64_t>() + 1;
        head.payload["last_sequence"] = dropped.sequence;
        head.sequence = dropped.sequence;
        head.timestamp_ms = dropped.timestamp_ms;
        buffer.erase(buffer.begin() + 1);
    }
}

} // anonymous namespace

const char* EventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::Progress:       return "progress";
        case EventKind::Completed:      return "completed";
        case EventKind::Failed:         return "failed";
        case EventKind::ContextChanged: return "context_changed";
        case EventKind::EventsDropped:  return "events_dropped";
    }
    return "unknown";
}

nlohmann::json Event::ToJson() const {
    return {
        {"kind", EventKindName(kind)},
        {"session_id", session_id},
        {"sequence", sequence},
        {"timestamp", timestamp_ms},
        {"payload", payload}
    };
}

// ---------------------------------------------------------------------------
// Subscription
// ---------------------------------------------------------------------------
Subscription::Subscription(std::shared_ptr<detail::EventChannel> channel,
                           std::uint64_t generation, std::string session_id,
                           bool resumed)
    : channel_(std::move(channel)),
      generation_(generation),
      session_id_(std::move(session_id)),
      resumed_(resumed) {}

Subscription::~Subscription() {
    Unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
    : channel_(std::move(other.channel_)),
      generation_(other.generation_),
      session_id_(std::move(other.session_id_)),
      resumed_(other.resumed_) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        Unsubscribe();
        channel_ = std::move(other.channel_);
        generation_ = other.generation_;
        session_id_ = std::move(other.session_id_);
        resumed_ = other.resumed_;
    }
    return *this;
}

std::optional<Event> Subscription::Next(std::chrono::milliseconds timeout) {
    if (!channel_) {
        return std::nullopt;
    }
    auto& channel = *channel_;
    std::unique_lock<std::mutex> lock(channel.mutex);
    auto detached = [this, &channel] {
        return channel.closed || !channel.attached || channel.generation != generation_;
    };
    channel.cv.wait_for(lock, timeout, [&] { return detached() || !channel.buffer.empty(); });
    if (detached() || channel.buffer.empty()) {
        return std::nullopt;
    }
    Event event = std::move(channel.buffer.front());
    channel.buffer.pop_front();
    channel.last_activity = std::chrono::steady_clock::now();
    return event;
}

bool Subscription::Active() const {
    if (!channel_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return !channel_->closed && channel_->attached && channel_->generation == generation_;
}

void Subscription::Unsubscribe() {
    if (!channel_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        if (channel_->generation == generation_) {
            channel_->attached = false;
            channel_->last_activity = std::chrono::steady_clock::now();
        }
    }
    channel_->cv.notify_all();
    channel_.reset();
}

// ---------------------------------------------------------------------------
// EventPublisher
// ---------------------------------------------------------------------------
EventPublisher::EventPublisher(std::size_t buffer_capacity)
    : capacity_(std::max<std::size_t>(buffer_capacity, 2)) {}

std::shared_ptr<detail::EventChannel> EventPublisher::Find(
    std::string_view session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = channels_.find(session_id);
    return it == channels_.end() ? nullptr : it->second;
}

std::shared_ptr<detail::EventChannel> EventPublisher::FindOrCreate(
    std::string_view session_id) {
    if (auto channel = Find(session_id)) {
        return channel;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = channels_.find(session_id);
    if (it == channels_.end()) {
        it = channels_.emplace(std::string(session_id),
                               std::make_shared<detail::EventChannel>()).first;
    }
    return it->second;
}

Subscription EventPublisher::Subscribe(std::string_view session_id) {
    std::shared_ptr<detail::EventChannel> channel;
    std::uint64_t generation = 0;
    bool resumed = false;
    for (;;) {
        channel = FindOrCreate(session_id);
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->closed) {
            // Swept between lookup and lock; the next lookup creates a new one.
            continue;
        }
        resumed = channel->ever_subscribed;
        channel->ever_subscribed = true;
        channel->attached = true;
        generation = ++channel->generation;
        channel->last_activity = std::chrono::steady_clock::now();
        break;
    }
    channel->cv.notify_all();
    LogDebug("events", std::string(resumed ? "resumed " : "subscribed ") +
                           std::string(session_id));
    return Subscription(std::move(channel), generation, std::string(session_id), resumed);
}

std::uint64_t EventPublisher::Publish(std::string_view session_id, EventKind kind,
                                      nlohmann::json payload) {
    std::shared_ptr<detail::EventChannel> channel;
    std::uint64_t sequence = 0;
    bool dropped = false;
    for (;;) {
        channel = FindOrCreate(session_id);
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->closed) {
            continue;
        }
        sequence = channel->next_sequence++;
        channel->buffer.push_back(Event{kind, std::string(session_id), sequence,
                                        std::move(payload), NowMillis()});
        if (channel->buffer.size() > capacity_) {
            Trim(*channel, capacity_);
            dropped = true;
        }
        channel->last_activity = std::chrono::steady_clock::now();
        break;
    }
    channel->cv.notify_all();
    if (dropped) {
        LogDebug("events", "buffer of session " + std::string(session_id) +
                               " overflowed; oldest events dropped");
    }
    return sequence;
}

void EventPublisher::CloseSession(std::string_view session_id) {
    std::shared_ptr<detail::EventChannel> channel;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = channels_.find(session_id);
        if (it == channels_.end()) {
            return;
        }
        channel = it->second;
        channels_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        channel->closed = true;
        channel->buffer.clear();
    }
    channel->cv.notify_all();
}

std::size_t EventPublisher::SweepIdle(std::chrono::seconds idle) {
    const auto cutoff = std::chrono::steady_clock::now() - idle;
    std::vector<std::shared_ptr<detail::EventChannel>> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = channels_.begin(); it != channels_.end();) {
            bool idle_channel = false;
            {
                std::lock_guard<std::mutex> channel_lock(it->second->mutex);
                idle_channel = !it->second->attached && it->second->last_activity < cutoff;
                if (idle_channel) {
                    it->second->closed = true;
                }
            }
            if (idle_channel) {
                removed.push_back(it->second);
                it = channels_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& channel : removed) {
        channel->cv.notify_all();
    }
    return removed.size();
}

std::size_t EventPublisher::Buffered(std::string_view session_id) const {
    auto channel = Find(session_id);
    if (!channel) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(channel->mutex);
    return channel->buffer.size();
}

std::size_t EventPublisher::SessionCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return channels_.size();
}

} // namespace toolsrv
