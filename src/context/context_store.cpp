#include <toolsrv/context/context_store.hpp>

#include <toolsrv/core/log.hpp>

#include <utility>

namespace toolsrv {

namespace {

Error KeyError(const std::string& operation, const std::string& message) {
    return Error{operation, message, ErrorCategory::Validation, std::nullopt};
}

} // anonymous namespace

ContextStore::ContextStore(std::chrono::seconds ttl,
                           std::shared_ptr<const IClock> clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

void ContextStore::SetChangeListener(ChangeListener listener) {
    listener_ = std::move(listener);
}

std::shared_ptr<ContextStore::Session> ContextStore::Find(
    std::string_view session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<ContextStore::Session> ContextStore::FindOrCreate(
    std::string_view session_id) {
    if (auto existing = Find(session_id)) {
        return existing;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    auto session = std::make_shared<Session>();
    session->created_at = clock_->Now();
    session->last_accessed = session->created_at;
    sessions_.emplace(std::string(session_id), session);
    LogDebug("context", "created session " + std::string(session_id));
    return session;
}

void ContextStore::Notify(const std::string& session_id,
                          const nlohmann::json& change) const {
    if (listener_) {
        listener_(session_id, change);
    }
}

Result<nlohmann::json, Error> ContextStore::Get(std::string_view session_id,
                                                std::string_view key) {
    if (key.empty()) {
        return Result<nlohmann::json, Error>::Err(
            KeyError("Get", "context key must not be empty"));
    }
    auto not_found = [&] {
        return Result<nlohmann::json, Error>::Err(Error{
            "Get", "no context value for key '" + std::string(key) + "'",
            ErrorCategory::ContextKeyNotFound, std::nullopt});
    };

    auto session = Find(session_id);
    if (!session) {
        return not_found();
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->evicted) {
        return not_found();
    }
    auto it = session->values.find(key);
    if (it == session->values.end()) {
        return not_found();
    }
    session->last_accessed = clock_->Now();
    return Result<nlohmann::json, Error>::Ok(it->second);
}

Result<void, Error> ContextStore::Set(std::string_view session_id,
                                      std::string_view key,
                                      nlohmann::json value) {
    if (key.empty()) {
        return Result<void, Error>::Err(KeyError("Set", "context key must not be empty"));
    }
    const std::string sid(session_id);
    for (;;) {
        auto session = FindOrCreate(session_id);
        std::unique_lock<std::mutex> lock(session->mutex);
        if (session->evicted) {
            // Lost a race with ExpireSweep or Close. Drop the stale entry so
            // the next lookup creates a fresh session.
            lock.unlock();
            std::unique_lock<std::shared_mutex> map_lock(mutex_);
            auto it = sessions_.find(session_id);
            if (it != sessions_.end() && it->second == session) {
                sessions_.erase(it);
            }
            continue;
        }
        nlohmann::json change = {{"key", std::string(key)},
                                 {"value", value},
                                 {"action", "set"}};
        session->values.insert_or_assign(std::string(key), std::move(value));
        session->last_accessed = clock_->Now();
        Notify(sid, change);
        return Result<void, Error>::Ok();
    }
}

Result<bool, Error> ContextStore::Delete(std::string_view session_id,
                                         std::string_view key) {
    if (key.empty()) {
        return Result<bool, Error>::Err(KeyError("Delete", "context key must not be empty"));
    }
    auto session = Find(session_id);
    if (!session) {
        return Result<bool, Error>::Ok(false);
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->evicted) {
        return Result<bool, Error>::Ok(false);
    }
    auto it = session->values.find(key);
    if (it == session->values.end()) {
        return Result<bool, Error>::Ok(false);
    }
    session->values.erase(it);
    session->last_accessed = clock_->Now();
    Notify(std::string(session_id), {{"key", std::string(key)}, {"action", "delete"}});
    return Result<bool, Error>::Ok(true);
}

std::vector<std::string> ContextStore::Keys(std::string_view session_id) {
    std::vector<std::string> keys;
    auto session = Find(session_id);
    if (!session) {
        return keys;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->evicted) {
        return keys;
    }
    keys.reserve(session->values.size());
    for (const auto& [key, value] : session->values) {
        keys.push_back(key);
    }
    session->last_accessed = clock_->Now();
    return keys;
}

bool ContextStore::Close(std::string_view session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> session_lock(it->second->mutex);
        it->second->evicted = true;
    }
    sessions_.erase(it);
    LogDebug("context", "closed session " + std::string(session_id));
    return true;
}

std::size_t ContextStore::ExpireSweep() {
    std::vector<std::pair<std::string, std::shared_ptr<Session>>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            snapshot.emplace_back(id, session);
        }
    }

    const auto now = clock_->Now();
    std::vector<std::pair<std::string, std::shared_ptr<Session>>> expired;
    for (auto& [id, session] : snapshot) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (!session->evicted && now - session->last_accessed > ttl_) {
            session->evicted = true;
            expired.emplace_back(id, session);
        }
    }
    if (expired.empty()) {
        return 0;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, session] : expired) {
            auto it = sessions_.find(id);
            if (it != sessions_.end() && it->second == session) {
                sessions_.erase(it);
            }
        }
    }
    LogInfo("context", "expired " + std::to_string(expired.size()) + " idle session(s)");
    return expired.size();
}

std::size_t ContextStore::SessionCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace toolsrv
