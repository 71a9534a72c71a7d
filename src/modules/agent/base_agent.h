// modules/agent/base_agent.h
#ifndef AGENTRT_MODULES_AGENT_BASE_AGENT_H
#define AGENTRT_MODULES_AGENT_BASE_AGENT_H

#include "agent/callbacks.h"
#include "agent/invocation_context.h"
#include "core/types/event.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace agentrt {

enum class AgentKind : uint8_t {
    LLM,
    SEQUENTIAL,
    PARALLEL,
    LOOP,
    CUSTOM
};

const char* agent_kind_to_string(AgentKind kind);

class BaseAgent;
using AgentPtr = std::shared_ptr<BaseAgent>;

// A task unit. Owns its children; the parent pointer is set once when the
// agent is handed to a parent's constructor.
class BaseAgent {
public:
    BaseAgent(std::string name, AgentKind kind, std::string description = "", std::vector<AgentPtr> sub_agents = {});
    virtual ~BaseAgent() = default;

    BaseAgent(const BaseAgent&) = delete;
    BaseAgent& operator=(const BaseAgent&) = delete;

    // Runs the unit with a context derived for this agent. Every event goes
    // through sink, which returns only after the event is committed. Returns
    // false when the sink asked to stop.
    bool run(InvocationContext& parent_ctx, const EventSink& sink);

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    AgentKind kind() const { return kind_; }

    BaseAgent* parent_agent() const { return parent_; }
    const std::vector<AgentPtr>& sub_agents() const { return sub_agents_; }

    BaseAgent& root_agent();
    // Depth-first search including this agent
    BaseAgent* find_agent(const std::string& name);
    // Descendants only
    BaseAgent* find_sub_agent(const std::string& name);

    void add_before_agent_callback(BeforeAgentCallback callback);
    void add_after_agent_callback(AfterAgentCallback callback);

protected:
    virtual bool run_impl(InvocationContext& ctx, const EventSink& sink) = 0;

private:
    // Returns nullopt to continue, otherwise the value run() returns
    std::optional<bool> handle_before_agent(InvocationContext& ctx, const EventSink& sink);
    bool handle_after_agent(InvocationContext& ctx, const EventSink& sink);

    std::string name_;
    AgentKind kind_;
    std::string description_;
    BaseAgent* parent_ = nullptr;
    std::vector<AgentPtr> sub_agents_;

    std::vector<BeforeAgentCallback> before_agent_callbacks_;
    std::vector<AfterAgentCallback> after_agent_callbacks_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_AGENT_BASE_AGENT_H
