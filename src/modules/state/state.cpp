// modules/state/state.cpp
#include "state/state.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cctype>

namespace agentrt {

namespace {

bool starts_with_ci(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

// Numbers of any representation count as one kind
int value_kind(const Value& v) {
    if (v.is_number()) return 0;
    return static_cast<int>(v.type()) + 1;
}

void validate_value(const std::string& key, const Value& v) {
    if (v.is_binary() || v.is_discarded()) {
        throw ValidationError("State value for key '" + key + "' is not serializable");
    }
    if (v.is_array()) {
        if (!v.empty()) {
            const int kind = value_kind(v.front());
            for (const auto& item : v) {
                if (item.is_null()) {
                    throw ValidationError("State value for key '" + key + "' contains null elements");
                }
                if (value_kind(item) != kind) {
                    throw ValidationError("State value for key '" + key + "' is a heterogeneous array");
                }
                validate_value(key, item);
            }
        }
    } else if (v.is_object()) {
        for (const auto& item : v) {
            validate_value(key, item);
        }
    }
}

} // namespace

StateScope scope_of(std::string_view key) {
    if (key.starts_with(kAppPrefix)) return StateScope::APP;
    if (key.starts_with(kUserPrefix)) return StateScope::USER;
    if (key.starts_with(kTempPrefix)) return StateScope::TEMP;
    return StateScope::SESSION;
}

std::string strip_scope_prefix(std::string_view key) {
    switch (scope_of(key)) {
        case StateScope::APP: return std::string(key.substr(kAppPrefix.size()));
        case StateScope::USER: return std::string(key.substr(kUserPrefix.size()));
        case StateScope::TEMP: return std::string(key.substr(kTempPrefix.size()));
        default: return std::string(key);
    }
}

ScopedStateDelta split_state_delta(const StateMap& delta) {
    ScopedStateDelta scoped;
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        const std::string& key = it.key();
        switch (scope_of(key)) {
            case StateScope::APP:
                scoped.app[strip_scope_prefix(key)] = it.value();
                break;
            case StateScope::USER:
                scoped.user[strip_scope_prefix(key)] = it.value();
                break;
            case StateScope::TEMP:
                scoped.temp[key] = it.value();
                break;
            case StateScope::SESSION:
                scoped.session[key] = it.value();
                break;
        }
    }
    return scoped;
}

void apply_state_delta(StateMap& target, const StateMap& delta) {
    if (!target.is_object()) target = StateMap::object();
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        if (is_tombstone(it.value())) {
            target.erase(it.key());
        } else {
            target[it.key()] = it.value();
        }
    }
}

StateMap merge_scoped_state(const StateMap& app_state, const StateMap& user_state, const StateMap& session_state) {
    StateMap merged = session_state.is_object() ? session_state : StateMap::object();
    for (auto it = app_state.begin(); it != app_state.end(); ++it) {
        merged[std::string(kAppPrefix) + it.key()] = it.value();
    }
    for (auto it = user_state.begin(); it != user_state.end(); ++it) {
        merged[std::string(kUserPrefix) + it.key()] = it.value();
    }
    return merged;
}

void validate_state_delta(const StateMap& delta) {
    if (!delta.is_object()) {
        throw ValidationError("state_delta must be an object");
    }
    for (auto it = delta.begin(); it != delta.end(); ++it) {
        const std::string& key = it.key();
        if (key.empty()) {
            throw ValidationError("state_delta contains an empty key");
        }
        for (auto prefix : {kAppPrefix, kUserPrefix, kTempPrefix}) {
            if (key.starts_with(prefix)) {
                if (key.size() == prefix.size()) {
                    throw ValidationError("state_delta key '" + key + "' has a scope prefix but no name");
                }
            } else if (starts_with_ci(key, prefix)) {
                throw ValidationError("state_delta key '" + key + "' uses an unknown scope prefix");
            }
        }
        if (!is_tombstone(it.value())) {
            validate_value(key, it.value());
        }
    }
}

// ————————————————————————
// State view
// ————————————————————————

State::State(const Session& session, StateMap& pending_delta)
    : session_(session), pending_delta_(pending_delta) {
    if (!pending_delta_.is_object()) pending_delta_ = StateMap::object();
}

Value State::get(const std::string& key, const Value& default_value) const {
    auto it = pending_delta_.find(key);
    if (it != pending_delta_.end()) {
        return is_tombstone(*it) ? default_value : *it;
    }
    auto committed = session_.get_state(key);
    return committed ? *committed : default_value;
}

bool State::has(const std::string& key) const {
    auto it = pending_delta_.find(key);
    if (it != pending_delta_.end()) return !is_tombstone(*it);
    return session_.has_state(key);
}

void State::set(const std::string& key, Value value) {
    pending_delta_[key] = std::move(value);
}

void State::erase(const std::string& key) {
    pending_delta_[key] = tombstone();
}

StateMap State::to_map() const {
    StateMap merged = session_.state();
    apply_state_delta(merged, pending_delta_);
    return merged;
}

} // namespace agentrt
