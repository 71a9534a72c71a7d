// src/core/content.cpp
#include "core/types/content.h"
#include "core/types/errors.h"

namespace agentrt {

Part Part::from_text(std::string text) {
    Part p;
    p.text = std::move(text);
    return p;
}

Part Part::from_function_call(FunctionCall call) {
    Part p;
    p.function_call = std::move(call);
    return p;
}

Part Part::from_function_response(FunctionResponse response) {
    Part p;
    p.function_response = std::move(response);
    return p;
}

Content Content::user_text(std::string text) {
    return Content{"user", {Part::from_text(std::move(text))}};
}

Content Content::model_text(std::string text) {
    return Content{"model", {Part::from_text(std::move(text))}};
}

std::string Content::text() const {
    std::string out;
    for (const auto& part : parts) {
        if (part.text) out += *part.text;
    }
    return out;
}

// ————————————————————————
// JSON conversion
// ————————————————————————

void to_json(Value& j, const FunctionCall& call) {
    j = Value{{"id", call.id}, {"name", call.name}, {"args", call.args}};
}

void from_json(const Value& j, FunctionCall& call) {
    call.id = j.value("id", "");
    call.name = j.at("name").get<std::string>();
    call.args = j.value("args", Value::object());
}

void to_json(Value& j, const FunctionResponse& response) {
    j = Value{{"id", response.id}, {"name", response.name}, {"response", response.response}};
}

void from_json(const Value& j, FunctionResponse& response) {
    response.id = j.value("id", "");
    response.name = j.at("name").get<std::string>();
    response.response = j.value("response", Value::object());
}

void to_json(Value& j, const Part& part) {
    j = Value::object();
    if (part.text) j["text"] = *part.text;
    if (part.function_call) j["function_call"] = *part.function_call;
    if (part.function_response) j["function_response"] = *part.function_response;
}

void from_json(const Value& j, Part& part) {
    if (j.contains("text")) {
        part.text = j["text"].get<std::string>();
    } else if (j.contains("function_call")) {
        part.function_call = j["function_call"].get<FunctionCall>();
    } else if (j.contains("function_response")) {
        part.function_response = j["function_response"].get<FunctionResponse>();
    } else {
        throw ValidationError("Content part has no text, function_call or function_response");
    }
}

void to_json(Value& j, const Content& content) {
    j = Value{{"role", content.role}, {"parts", content.parts}};
}

void from_json(const Value& j, Content& content) {
    content.role = j.value("role", "");
    content.parts = j.value("parts", std::vector<Part>{});
}

} // namespace agentrt
