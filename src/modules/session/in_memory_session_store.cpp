// modules/session/in_memory_session_store.cpp
#include "session/in_memory_session_store.h"
#include "common/utils/ids.h"
#include "core/types/errors.h"

namespace agentrt {

SessionPtr InMemorySessionStore::create_session(const std::string& app_name,
                                                const std::string& user_id,
                                                std::optional<std::string> session_id,
                                                StateMap initial_state) {
    if (!initial_state.is_object()) initial_state = StateMap::object();
    validate_state_delta(initial_state);

    std::string id = session_id.value_or(new_uuid());
    ScopedStateDelta scoped = split_state_delta(initial_state);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& user_sessions = sessions_[app_name][user_id];
    if (user_sessions.count(id) > 0) {
        throw AlreadyExistsError("Session with id " + id + " already exists");
    }

    apply_state_delta(app_state_[app_name], scoped.app);
    apply_state_delta(user_state_[app_name][user_id], scoped.user);

    StoredSession stored;
    apply_state_delta(stored.state, scoped.session);
    stored.last_update_time = now_seconds();
    auto [it, inserted] = user_sessions.emplace(id, std::move(stored));

    return materialize(app_name, user_id, id, it->second, {});
}

SessionPtr InMemorySessionStore::get_session(const std::string& app_name,
                                             const std::string& user_id,
                                             const std::string& session_id,
                                             const GetSessionConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto app_it = sessions_.find(app_name);
    if (app_it == sessions_.end()) return nullptr;
    auto user_it = app_it->second.find(user_id);
    if (user_it == app_it->second.end()) return nullptr;
    auto session_it = user_it->second.find(session_id);
    if (session_it == user_it->second.end()) return nullptr;

    return materialize(app_name, user_id, session_id, session_it->second, config);
}

std::vector<std::string> InMemorySessionStore::list_sessions(const std::string& app_name, const std::string& user_id) {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    auto app_it = sessions_.find(app_name);
    if (app_it == sessions_.end()) return ids;
    auto user_it = app_it->second.find(user_id);
    if (user_it == app_it->second.end()) return ids;
    for (const auto& [id, _] : user_it->second) {
        ids.push_back(id);
    }
    return ids;
}

void InMemorySessionStore::delete_session(const std::string& app_name, const std::string& user_id, const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto app_it = sessions_.find(app_name);
        if (app_it == sessions_.end()) return;
        auto user_it = app_it->second.find(user_id);
        if (user_it == app_it->second.end()) return;
        user_it->second.erase(session_id);
    }
    forget_session_lock(app_name, user_id, session_id);
}

void InMemorySessionStore::persist_event(const Session& session, const Event& event, const ScopedStateDelta& delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& user_sessions = sessions_[session.app_name()][session.user_id()];
    auto it = user_sessions.find(session.id());
    if (it == user_sessions.end()) {
        throw NotFoundError("Session " + session.id() + " not found");
    }

    apply_state_delta(app_state_[session.app_name()], delta.app);
    apply_state_delta(user_state_[session.app_name()][session.user_id()], delta.user);
    apply_state_delta(it->second.state, delta.session);
    it->second.events.push_back(event);
    it->second.last_update_time = event.timestamp;
}

SessionPtr InMemorySessionStore::materialize(const std::string& app_name,
                                             const std::string& user_id,
                                             const std::string& session_id,
                                             const StoredSession& stored,
                                             const GetSessionConfig& config) const {
    StateMap app_state = StateMap::object();
    if (auto it = app_state_.find(app_name); it != app_state_.end()) {
        app_state = it->second;
    }
    StateMap user_state = StateMap::object();
    if (auto app_it = user_state_.find(app_name); app_it != user_state_.end()) {
        if (auto it = app_it->second.find(user_id); it != app_it->second.end()) {
            user_state = it->second;
        }
    }

    return std::make_shared<Session>(app_name,
                                     user_id,
                                     session_id,
                                     merge_scoped_state(app_state, user_state, stored.state),
                                     filter_events(stored.events, config),
                                     stored.last_update_time);
}

} // namespace agentrt
