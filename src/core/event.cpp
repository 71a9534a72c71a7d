// src/core/event.cpp
#include "core/types/event.h"
#include "common/utils/ids.h"

namespace agentrt {

bool EventActions::empty() const {
    return state_delta.empty() && artifact_delta.empty() && !escalate && !skip_downstream_processing;
}

void EventActions::merge(const EventActions& other) {
    for (auto it = other.state_delta.begin(); it != other.state_delta.end(); ++it) {
        state_delta[it.key()] = it.value();
    }
    for (const auto& [filename, version] : other.artifact_delta) {
        artifact_delta[filename] = version;
    }
    escalate = escalate || other.escalate;
    skip_downstream_processing = skip_downstream_processing || other.skip_downstream_processing;
}

Event Event::create(std::string invocation_id, std::string author, std::string branch) {
    Event e;
    e.id = new_uuid();
    e.invocation_id = std::move(invocation_id);
    e.author = std::move(author);
    e.branch = std::move(branch);
    e.timestamp = now_seconds();
    return e;
}

std::vector<FunctionCall> Event::function_calls() const {
    std::vector<FunctionCall> calls;
    if (!content) return calls;
    for (const auto& part : content->parts) {
        if (part.function_call) calls.push_back(*part.function_call);
    }
    return calls;
}

std::vector<FunctionResponse> Event::function_responses() const {
    std::vector<FunctionResponse> responses;
    if (!content) return responses;
    for (const auto& part : content->parts) {
        if (part.function_response) responses.push_back(*part.function_response);
    }
    return responses;
}

bool Event::is_final_response() const {
    if (actions.skip_downstream_processing) return true;
    return !partial && function_calls().empty() && function_responses().empty();
}

std::string Event::text() const {
    return content ? content->text() : std::string{};
}

// ————————————————————————
// JSON conversion
// ————————————————————————

void to_json(Value& j, const EventActions& actions) {
    j = Value{
        {"state_delta", actions.state_delta},
        {"artifact_delta", actions.artifact_delta},
        {"escalate", actions.escalate},
        {"skip_downstream_processing", actions.skip_downstream_processing}
    };
}

void from_json(const Value& j, EventActions& actions) {
    actions.state_delta = j.value("state_delta", StateMap::object());
    actions.artifact_delta = j.value("artifact_delta", std::map<std::string, int>{});
    actions.escalate = j.value("escalate", false);
    actions.skip_downstream_processing = j.value("skip_downstream_processing", false);
}

void to_json(Value& j, const Event& event) {
    j = Value{
        {"id", event.id},
        {"invocation_id", event.invocation_id},
        {"author", event.author},
        {"branch", event.branch},
        {"actions", event.actions},
        {"partial", event.partial},
        {"timestamp", event.timestamp}
    };
    if (event.content) j["content"] = *event.content;
    if (event.error_code) j["error_code"] = *event.error_code;
    if (event.error_message) j["error_message"] = *event.error_message;
}

void from_json(const Value& j, Event& event) {
    event.id = j.at("id").get<std::string>();
    event.invocation_id = j.value("invocation_id", "");
    event.author = j.value("author", "");
    event.branch = j.value("branch", "");
    event.actions = j.value("actions", EventActions{});
    event.partial = j.value("partial", false);
    event.timestamp = j.value("timestamp", 0.0);
    if (j.contains("content")) event.content = j["content"].get<Content>();
    if (j.contains("error_code")) event.error_code = j["error_code"].get<std::string>();
    if (j.contains("error_message")) event.error_message = j["error_message"].get<std::string>();
}

} // namespace agentrt
