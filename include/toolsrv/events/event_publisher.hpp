#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
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

#include <nlohmann/json.hpp>

namespace toolsrv {

enum class EventKind {
    Progress,
    Completed,
    Failed,
    ContextChanged,
    EventsDropped,
};

const char* EventKindName(EventKind kind);

struct Event {
    EventKind kind = EventKind::Progress;
    std::string session_id;
    std::uint64_t sequence = 0;
    nlohmann::json payload = nlohmann::json::object();
    std::int64_t timestamp_ms = 0;  // wall clock, ms since epoch

    [[nodiscard]] nlohmann::json ToJson() const;
};

namespace detail {
struct EventChannel;
} // namespace detail

// ---------------------------------------------------------------------------
// Subscription: delivery end of one session's event channel.
//
// Next() yields events in strictly increasing sequence order until the
// subscription is detached: by Unsubscribe(), destruction, a newer
// subscription for the same session, or CloseSession(). Movable, not
// copyable.
// ---------------------------------------------------------------------------
class Subscription {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Waits up to `timeout` for the next event. nullopt on timeout or once
    // detached (check Active() to tell the two apart).
    std::optional<Event> Next(std::chrono::milliseconds timeout);

    [[nodiscard]] bool Active() const;
    // True when an earlier subscription for this session existed; events
    // published while nobody was attached may have been dropped.
    [[nodiscard]] bool Resumed() const noexcept { return resumed_; }
    [[nodiscard]] const std::string& SessionId() const noexcept { return session_id_; }

    void Unsubscribe();

private:
    friend class EventPublisher;
    Subscription(std::shared_ptr<detail::EventChannel> channel, std::uint64_t generation,
                 std::string session_id, bool resumed);

    std::shared_ptr<detail::EventChannel> channel_;
    std::uint64_t generation_ = 0;
    std::string session_id_;
    bool resumed_ = false;
};

// ---------------------------------------------------------------------------
// EventPublisher: per-session ordered event channels with a bounded buffer.
//
// When a session's buffer exceeds its capacity, the oldest events are
// folded into a single events_dropped marker at the head of the buffer:
// payload {dropped, first_sequence, last_sequence}, sequence equal to the
// last event it covers.
// ---------------------------------------------------------------------------
class EventPublisher {
public:
    explicit EventPublisher(std::size_t buffer_capacity = 256);

    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

    // Replaces any existing subscription for the session.
    [[nodiscard]] Subscription Subscribe(std::string_view session_id);

    // Returns the sequence number assigned to the event.
    std::uint64_t Publish(std::string_view session_id, EventKind kind,
                          nlohmann::json payload);

    void CloseSession(std::string_view session_id);

    // Drops channels with no subscriber and no activity for `idle`.
    std::size_t SweepIdle(std::chrono::seconds idle);

    [[nodiscard]] std::size_t Buffered(std::string_view session_id) const;
    [[nodiscard]] std::size_t SessionCount() const;
    [[nodiscard]] std::size_t Capacity() const noexcept { return capacity_; }

private:
    std::shared_ptr<detail::EventChannel> Find(std::string_view session_id) const;
    std::shared_ptr<detail::EventChannel> FindOrCreate(std::string_view session_id);

    std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<detail::EventChannel>, std::less<>> channels_;
};

} // namespace toolsrv
