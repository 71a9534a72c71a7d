// modules/session/sqlite_session_store.h
#ifndef AGENTRT_MODULES_SESSION_SQLITE_SESSION_STORE_H
#define AGENTRT_MODULES_SESSION_SQLITE_SESSION_STORE_H

#include "session/session_store.h"
#include "session/sqlite_db.h"
#include <memory>
#include <mutex>

namespace agentrt {

// Durable backend. Layout:
//   app_states   (app_name)                       -> state json
//   user_states  (app_name, user_id)              -> state json
//   sessions     (app_name, user_id, id)          -> session-scope state json
//   events       append-only log per session, ordered by seq
class SqliteSessionStore : public SessionStore {
public:
    explicit SqliteSessionStore(const std::string& db_path);

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
    void migrate();

    StateMap load_app_state(const std::string& app_name);
    StateMap load_user_state(const std::string& app_name, const std::string& user_id);
    void store_app_state(const std::string& app_name, const StateMap& state, double now);
    void store_user_state(const std::string& app_name, const std::string& user_id, const StateMap& state, double now);

    std::mutex mutex_; // one connection, one writer at a time
    SqliteDb db_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_SESSION_SQLITE_SESSION_STORE_H
