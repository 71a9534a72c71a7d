// src/core/session.cpp
#include "core/types/session.h"

namespace agentrt {

Session::Session(std::string app_name,
                 std::string user_id,
                 std::string id,
                 StateMap state,
                 std::vector<Event> events,
                 double last_update_time)
    : app_name_(std::move(app_name)),
      user_id_(std::move(user_id)),
      id_(std::move(id)),
      state_(state.is_object() ? std::move(state) : StateMap::object()),
      events_(std::move(events)),
      last_update_time_(last_update_time) {}

StateMap Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Value> Session::get_state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.find(key);
    if (it == state_.end()) return std::nullopt;
    return *it;
}

bool Session::has_state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.contains(key);
}

std::vector<Event> Session::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t Session::event_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

double Session::last_update_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_update_time_;
}

std::shared_ptr<Session> Session::clone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_shared<Session>(app_name_, user_id_, id_, state_, events_, last_update_time_);
}

void Session::apply_committed(const Event& event, const StateMap& full_delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = full_delta.begin(); it != full_delta.end(); ++it) {
        if (is_tombstone(it.value())) {
            state_.erase(it.key());
        } else {
            state_[it.key()] = it.value();
        }
    }
    events_.push_back(event);
    last_update_time_ = event.timestamp;
}

} // namespace agentrt
