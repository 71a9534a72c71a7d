// modules/session/session_store.h
#ifndef AGENTRT_MODULES_SESSION_SESSION_STORE_H
#define AGENTRT_MODULES_SESSION_SESSION_STORE_H

#include "core/types/event.h"
#include "core/types/session.h"
#include "modules/state/state.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentrt {

struct GetSessionConfig {
    std::optional<int> num_recent_events;   // keep only the last N events; <= 0 means no limit
    std::optional<double> after_timestamp;  // keep events with timestamp >= value
};

// Contract every persistence backend satisfies. Backends differ only in
// durability; append_event (scope routing, temp handling, per-session
// serialisation) is implemented once here.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual SessionPtr create_session(const std::string& app_name,
                                      const std::string& user_id,
                                      std::optional<std::string> session_id = std::nullopt,
                                      StateMap initial_state = StateMap::object()) = 0;

    // nullptr when the session does not exist
    virtual SessionPtr get_session(const std::string& app_name,
                                   const std::string& user_id,
                                   const std::string& session_id,
                                   const GetSessionConfig& config = {}) = 0;

    virtual std::vector<std::string> list_sessions(const std::string& app_name,
                                                   const std::string& user_id) = 0;

    virtual void delete_session(const std::string& app_name,
                                const std::string& user_id,
                                const std::string& session_id) = 0;

    // Sole mutation entry point. Partial events are returned untouched and not
    // appended. Otherwise the event is validated, its durable deltas are written
    // by the backend, and `session` (the committed session) receives the full
    // delta including temp: keys. The returned event is what was persisted
    // (temp: keys stripped from its state_delta).
    Event append_event(Session& session, const Event& event);

protected:
    // Writes the event and its app/user/session deltas atomically. Called with
    // the per-session commit lock held.
    virtual void persist_event(const Session& session, const Event& event, const ScopedStateDelta& delta) = 0;

    // Backends call this when a session is deleted
    void forget_session_lock(const std::string& app_name, const std::string& user_id, const std::string& session_id);

    static void validate_event(const Event& event);
    static std::vector<Event> filter_events(std::vector<Event> events, const GetSessionConfig& config);

private:
    std::shared_ptr<std::mutex> session_lock(const std::string& app_name, const std::string& user_id, const std::string& session_id);

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_SESSION_SESSION_STORE_H
