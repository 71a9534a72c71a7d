// modules/state/state.h
#ifndef AGENTRT_MODULES_STATE_STATE_H
#define AGENTRT_MODULES_STATE_STATE_H

#include "core/types/session.h"
#include "core/types/value.h"
#include <string>
#include <string_view>

namespace agentrt {

enum class StateScope : uint8_t {
    SESSION, // no prefix
    USER,    // user:
    APP,     // app:
    TEMP     // temp:, never persisted
};

inline constexpr std::string_view kAppPrefix = "app:";
inline constexpr std::string_view kUserPrefix = "user:";
inline constexpr std::string_view kTempPrefix = "temp:";

StateScope scope_of(std::string_view key);
std::string strip_scope_prefix(std::string_view key);

// A state_delta routed by scope. app/user keys are stored without their prefix,
// session keys as-is, temp keys keep their prefix.
struct ScopedStateDelta {
    StateMap app = StateMap::object();
    StateMap user = StateMap::object();
    StateMap session = StateMap::object();
    StateMap temp = StateMap::object();

    bool has_durable_changes() const { return !app.empty() || !user.empty() || !session.empty(); }
};

ScopedStateDelta split_state_delta(const StateMap& delta);

// Tombstone-aware: null values erase the key
void apply_state_delta(StateMap& target, const StateMap& delta);

// Flattened view presented to agents: session keys plain, app:/user: prefixed
StateMap merge_scoped_state(const StateMap& app_state, const StateMap& user_state, const StateMap& session_state);

// Throws ValidationError on empty keys, bare or miscased scope prefixes and
// values that are not plain serializable data
void validate_state_delta(const StateMap& delta);

// Read/write view used by callbacks and tools. Reads see the pending delta first
// (dirty reads within a step), then the committed session state. Writes only
// touch the pending delta, which the runner commits with the owning event.
class State {
public:
    State(const Session& session, StateMap& pending_delta);

    Value get(const std::string& key, const Value& default_value = nullptr) const;
    bool has(const std::string& key) const;
    void set(const std::string& key, Value value);
    void erase(const std::string& key);

    bool has_delta() const { return !pending_delta_.empty(); }
    // Committed state with the pending delta applied
    StateMap to_map() const;

private:
    const Session& session_;
    StateMap& pending_delta_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_STATE_STATE_H
