// common/llm/model_client.h
#ifndef AGENTRT_COMMON_LLM_MODEL_CLIENT_H
#define AGENTRT_COMMON_LLM_MODEL_CLIENT_H

#include "core/types/content.h"
#include "core/types/value.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

struct ToolDeclaration {
    std::string name;
    std::string description;
    Value parameters = Value::object(); // JSON schema of the arguments
};

struct LlmRequest {
    std::string model;
    std::string system_instruction;
    std::vector<Content> contents;
    std::vector<ToolDeclaration> tools;
};

struct LlmResponse {
    std::optional<Content> content;
    bool partial = false;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
};

// Receives each (partial or final) response. Returning false aborts generation.
using ResponseCallback = std::function<bool(const LlmResponse&)>;

// Boundary to the reasoning engine. When stream is true the client reports
// partial fragments followed by one non-partial aggregate; otherwise exactly one
// non-partial response.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual std::string name() const = 0;

    // Returns false when on_response asked to stop
    virtual bool generate_content(const LlmRequest& request, bool stream, const ResponseCallback& on_response) = 0;
};

void to_json(Value& j, const ToolDeclaration& decl);

} // namespace agentrt

#endif // AGENTRT_COMMON_LLM_MODEL_CLIENT_H
