#ifndef AGENTRT_CORE_TYPES_EVENT_H
#define AGENTRT_CORE_TYPES_EVENT_H

#include "content.h"
#include "value.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

// Side effects an event asks the runner to commit
struct EventActions {
    StateMap state_delta = StateMap::object();   // key -> value, null = delete
    std::map<std::string, int> artifact_delta;   // filename -> saved version
    bool escalate = false;                       // terminate the enclosing loop
    bool skip_downstream_processing = false;

    bool empty() const;
    // Later writes win; used to fold callback/tool actions into one event
    void merge(const EventActions& other);
};

struct Event {
    std::string id;
    std::string invocation_id;
    std::string author;
    std::string branch;
    std::optional<Content> content;
    EventActions actions;
    bool partial = false;
    double timestamp = 0.0;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;

    // Fills id and timestamp
    static Event create(std::string invocation_id, std::string author, std::string branch = "");

    std::vector<FunctionCall> function_calls() const;
    std::vector<FunctionResponse> function_responses() const;
    bool is_final_response() const;
    std::string text() const;
};

// Receives one event at a time. Returning false tells the producer to stop.
using EventSink = std::function<bool(const Event&)>;

void to_json(Value& j, const EventActions& actions);
void from_json(const Value& j, EventActions& actions);
void to_json(Value& j, const Event& event);
void from_json(const Value& j, Event& event);

} // namespace agentrt

#endif // AGENTRT_CORE_TYPES_EVENT_H
