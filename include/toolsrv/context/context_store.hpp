#pragma once

#include <toolsrv/core/clock.hpp>
#include <toolsrv/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolsrv {

// ---------------------------------------------------------------------------
// ContextStore: per-session key/value state.
//
// Sessions are created on first write and evicted when idle longer than the
// store-wide TTL (ExpireSweep) or on Close. The session map is only locked
// to look up, snapshot or erase entries; each session has its own mutex, so
// a sweep never blocks access to live sessions.
//
// The change listener is invoked while the session lock is held, so change
// notifications for one session are emitted in write order.
// ---------------------------------------------------------------------------
class ContextStore {
public:
    using ChangeListener =
        std::function<void(const std::string& session_id, const nlohmann::json& change)>;

    explicit ContextStore(std::chrono::seconds ttl,
                          std::shared_ptr<const IClock> clock = DefaultClock());

    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    // Must be set before the store is shared between threads.
    void SetChangeListener(ChangeListener listener);

    // ContextKeyNotFound if the session or key is absent. Never creates a
    // session.
    [[nodiscard]] Result<nlohmann::json, Error> Get(std::string_view session_id,
                                                    std::string_view key);
    Result<void, Error> Set(std::string_view session_id, std::string_view key,
                            nlohmann::json value);
    // Idempotent. Returns whether the key existed.
    Result<bool, Error> Delete(std::string_view session_id, std::string_view key);

    [[nodiscard]] std::vector<std::string> Keys(std::string_view session_id);
    bool Close(std::string_view session_id);

    // Evicts sessions idle longer than the TTL. Returns how many.
    std::size_t ExpireSweep();

    [[nodiscard]] std::size_t SessionCount() const;
    [[nodiscard]] std::chrono::seconds Ttl() const noexcept { return ttl_; }

private:
    struct Session {
        std::mutex mutex;
        std::map<std::string, nlohmann::json, std::less<>> values;
        IClock::TimePoint created_at;
        IClock::TimePoint last_accessed;
        bool evicted = false;
    };

    std::shared_ptr<Session> Find(std::string_view session_id) const;
    std::shared_ptr<Session> FindOrCreate(std::string_view session_id);
    void Notify(const std::string& session_id, const nlohmann::json& change) const;

    std::chrono::seconds ttl_;
    std::shared_ptr<const IClock> clock_;
    ChangeListener listener_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>, std::less<>> sessions_;
};

} // namespace toolsrv
