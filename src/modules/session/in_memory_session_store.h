// modules/session/in_memory_session_store.h
#ifndef AGENTRT_MODULES_SESSION_IN_MEMORY_SESSION_STORE_H
#define AGENTRT_MODULES_SESSION_IN_MEMORY_SESSION_STORE_H

#include "session/session_store.h"
#include <map>
#include <mutex>

namespace agentrt {

// Volatile backend: every scope is lost when the store is destroyed
class InMemorySessionStore : public SessionStore {
public:
    SessionPtr create_session(const std::string& app_name,
                              const std::string& user_id,
                              std::optional<std::string> session_id = std::nullopt,
                              StateMap initial_state = StateMap::object()) override;

    SessionPtr get_session(const std::string& app_name,
                           const std::string& user_id,
                           const std::string& session_id,
                           const GetSessionConfig& config = {}) override;

    std::vector<std::string> list_sessions(const std::string& app_name, const std::string& user_id) override;

    void delete_session(const std::string& app_name, const std::string& user_id, const std::string& session_id) override;

protected:
    void persist_event(const Session& session, const Event& event, const ScopedStateDelta& delta) override;

private:
    struct StoredSession {
        StateMap state = StateMap::object(); // session scope only
        std::vector<Event> events;
        double last_update_time = 0.0;
    };

    SessionPtr materialize(const std::string& app_name,
                           const std::string& user_id,
                           const std::string& session_id,
                           const StoredSession& stored,
                           const GetSessionConfig& config) const;

    mutable std::mutex mutex_;
    std::map<std::string, StateMap> app_state_;                                   // app
    std::map<std::string, std::map<std::string, StateMap>> user_state_;           // app -> user
    std::map<std::string, std::map<std::string, std::map<std::string, StoredSession>>> sessions_; // app -> user -> id
};

} // namespace agentrt

#endif // AGENTRT_MODULES_SESSION_IN_MEMORY_SESSION_STORE_H
