// modules/session/session_store.cpp
#include "session/session_store.h"
#include "common/logging/logger.h"
#include "core/types/errors.h"
#include <algorithm>

namespace agentrt {

namespace {

std::string lock_key(const std::string& app_name, const std::string& user_id, const std::string& session_id) {
    std::string key;
    key.reserve(app_name.size() + user_id.size() + session_id.size() + 2);
    key.append(app_name).push_back('\x1f');
    key.append(user_id).push_back('\x1f');
    key.append(session_id);
    return key;
}

} // namespace

Event SessionStore::append_event(Session& session, const Event& event) {
    if (event.partial) {
        return event;
    }
    validate_event(event);

    // 1. Route the delta by scope; temp: never reaches the backend
    ScopedStateDelta scoped = split_state_delta(event.actions.state_delta);

    Event persisted = event;
    for (auto it = scoped.temp.begin(); it != scoped.temp.end(); ++it) {
        persisted.actions.state_delta.erase(it.key());
    }

    // 2. Serialise commits per session so concurrent writers never lose updates
    auto commit_mutex = session_lock(session.app_name(), session.user_id(), session.id());
    std::lock_guard<std::mutex> lock(*commit_mutex);
    persist_event(session, persisted, scoped);

    // 3. Update the caller's in-memory session, temp: keys included
    session.apply_committed(persisted, event.actions.state_delta);

    AGENTRT_LOG_DEBUG("Committed event {} by '{}' to session {} ({} state keys)",
                      persisted.id, persisted.author, session.id(), event.actions.state_delta.size());
    return persisted;
}

void SessionStore::validate_event(const Event& event) {
    if (event.id.empty()) {
        throw ValidationError("Event has no id");
    }
    if (event.author.empty()) {
        throw ValidationError("Event " + event.id + " has no author");
    }
    validate_state_delta(event.actions.state_delta);
    for (const auto& [filename, version] : event.actions.artifact_delta) {
        if (filename.empty() || version < 0) {
            throw ValidationError("Event " + event.id + " has a malformed artifact_delta entry");
        }
    }
}

std::vector<Event> SessionStore::filter_events(std::vector<Event> events, const GetSessionConfig& config) {
    if (config.after_timestamp) {
        const double after = *config.after_timestamp;
        events.erase(std::remove_if(events.begin(), events.end(),
                                    [after](const Event& e) { return e.timestamp < after; }),
                     events.end());
    }
    if (config.num_recent_events && *config.num_recent_events > 0) {
        const size_t keep = static_cast<size_t>(*config.num_recent_events);
        if (events.size() > keep) {
            events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(keep));
        }
    }
    return events;
}

std::shared_ptr<std::mutex> SessionStore::session_lock(const std::string& app_name, const std::string& user_id, const std::string& session_id) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto& slot = session_locks_[lock_key(app_name, user_id, session_id)];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void SessionStore::forget_session_lock(const std::string& app_name, const std::string& user_id, const std::string& session_id) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    session_locks_.erase(lock_key(app_name, user_id, session_id));
}

} // namespace agentrt
