// modules/agent/callbacks.h
#ifndef AGENTRT_MODULES_AGENT_CALLBACKS_H
#define AGENTRT_MODULES_AGENT_CALLBACKS_H

#include "agent/invocation_context.h"
#include "common/llm/model_client.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

// std::nullopt = no decision. A value skips the guarded step (before hooks) or
// replaces its result (after hooks).
using BeforeAgentCallback = std::function<std::optional<Content>(CallbackContext&)>;
using AfterAgentCallback = std::function<std::optional<Content>(CallbackContext&)>;

using BeforeModelCallback = std::function<std::optional<LlmResponse>(CallbackContext&, LlmRequest&)>;
using AfterModelCallback = std::function<std::optional<LlmResponse>(CallbackContext&, const LlmResponse&)>;

using BeforeToolCallback =
    std::function<std::optional<Value>(const std::string& tool_name, Value& args, ToolContext&)>;
using AfterToolCallback =
    std::function<std::optional<Value>(const std::string& tool_name, const Value& args, ToolContext&, const Value& result)>;

// Runs the chain in registration order; the first callback returning a value
// wins and the rest are not called. Exceptions propagate.
template <typename R, typename... Params, typename... Args>
R run_callback_chain(const std::vector<std::function<R(Params...)>>& chain, Args&&... args) {
    for (const auto& callback : chain) {
        if (!callback) continue;
        R result = callback(args...);
        if (result) return result;
    }
    return R{};
}

} // namespace agentrt

#endif // AGENTRT_MODULES_AGENT_CALLBACKS_H
