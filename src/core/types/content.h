#ifndef AGENTRT_CORE_TYPES_CONTENT_H
#define AGENTRT_CORE_TYPES_CONTENT_H

#include "value.h"
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

struct FunctionCall {
    std::string id;
    std::string name;
    Value args = Value::object();
};

struct FunctionResponse {
    std::string id;
    std::string name;
    Value response = Value::object();
};

// Exactly one of the members is set
struct Part {
    std::optional<std::string> text;
    std::optional<FunctionCall> function_call;
    std::optional<FunctionResponse> function_response;

    static Part from_text(std::string text);
    static Part from_function_call(FunctionCall call);
    static Part from_function_response(FunctionResponse response);
};

struct Content {
    std::string role; // "user" or "model"
    std::vector<Part> parts;

    static Content user_text(std::string text);
    static Content model_text(std::string text);

    // Concatenation of all text parts
    std::string text() const;
    bool empty() const { return parts.empty(); }
};

void to_json(Value& j, const FunctionCall& call);
void from_json(const Value& j, FunctionCall& call);
void to_json(Value& j, const FunctionResponse& response);
void from_json(const Value& j, FunctionResponse& response);
void to_json(Value& j, const Part& part);
void from_json(const Value& j, Part& part);
void to_json(Value& j, const Content& content);
void from_json(const Value& j, Content& content);

} // namespace agentrt

#endif // AGENTRT_CORE_TYPES_CONTENT_H
