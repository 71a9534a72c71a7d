#ifndef AGENTRT_CORE_TYPES_SESSION_H
#define AGENTRT_CORE_TYPES_SESSION_H

#include "event.h"
#include "value.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

class SessionStore;

// One conversation thread: identity, append-only event history and the flattened
// state view (session keys unprefixed, user:/app:/temp: keys with their prefix).
// Readers are thread-safe; only SessionStore mutates a session.
class Session {
public:
    Session(std::string app_name,
            std::string user_id,
            std::string id,
            StateMap state = StateMap::object(),
            std::vector<Event> events = {},
            double last_update_time = 0.0);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    const std::string& app_name() const { return app_name_; }
    const std::string& user_id() const { return user_id_; }

    StateMap state() const;
    std::optional<Value> get_state(const std::string& key) const;
    bool has_state(const std::string& key) const;

    std::vector<Event> events() const;
    size_t event_count() const;
    double last_update_time() const;

    std::shared_ptr<Session> clone() const;

private:
    friend class SessionStore;

    // Applies a tombstone-aware delta and appends the event. Caller holds the
    // per-session commit lock of the store.
    void apply_committed(const Event& event, const StateMap& full_delta);

    std::string app_name_;
    std::string user_id_;
    std::string id_;

    mutable std::mutex mutex_;
    StateMap state_;
    std::vector<Event> events_;
    double last_update_time_;
};

using SessionPtr = std::shared_ptr<Session>;

} // namespace agentrt

#endif // AGENTRT_CORE_TYPES_SESSION_H
