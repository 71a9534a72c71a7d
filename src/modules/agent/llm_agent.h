// modules/agent/llm_agent.h
#ifndef AGENTRT_MODULES_AGENT_LLM_AGENT_H
#define AGENTRT_MODULES_AGENT_LLM_AGENT_H

#include "agent/base_agent.h"
#include "common/llm/model_client.h"
#include "common/tools/registry.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

// Leaf unit backed by a model. One step: build the request, call the model,
// emit its answer; if the answer requests tools, run them, emit the merged
// function responses and call the model again.
class LlmAgent : public BaseAgent {
public:
    struct Config {
        std::string name;
        std::string description;
        std::string instruction;                 // inja template over session state
        std::shared_ptr<ModelClient> model;
        std::shared_ptr<ToolRegistry> tool_registry;
        std::vector<std::string> tools;          // names in tool_registry offered to the model
        std::optional<std::string> output_key;   // final text is written to this state key
        bool include_contents = true;            // false: only the current user message is sent
    };

    explicit LlmAgent(Config config);

    const Config& config() const { return config_; }

    void add_before_model_callback(BeforeModelCallback callback);
    void add_after_model_callback(AfterModelCallback callback);
    void add_before_tool_callback(BeforeToolCallback callback);
    void add_after_tool_callback(AfterToolCallback callback);

    // Exposed for tests
    LlmRequest build_request(const InvocationContext& ctx) const;

protected:
    bool run_impl(InvocationContext& ctx, const EventSink& sink) override;

private:
    std::vector<Content> build_contents(const InvocationContext& ctx) const;
    Content foreign_event_as_context(const Event& event) const;

    // Calls the model (or a before_model override). nullopt when the sink stopped.
    std::optional<LlmResponse> call_model(InvocationContext& ctx, LlmRequest& request,
                                          CallbackContext& callback_ctx, const EventSink& sink);

    Event handle_function_calls(InvocationContext& ctx, const std::vector<FunctionCall>& calls);

    Config config_;
    std::vector<BeforeModelCallback> before_model_callbacks_;
    std::vector<AfterModelCallback> after_model_callbacks_;
    std::vector<BeforeToolCallback> before_tool_callbacks_;
    std::vector<AfterToolCallback> after_tool_callbacks_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_AGENT_LLM_AGENT_H
