// modules/agent/sequential_agent.cpp
#include "agent/sequential_agent.h"

namespace agentrt {

SequentialAgent::SequentialAgent(std::string name, std::vector<AgentPtr> sub_agents, std::string description)
    : BaseAgent(std::move(name), AgentKind::SEQUENTIAL, std::move(description), std::move(sub_agents)) {}

bool SequentialAgent::run_impl(InvocationContext& ctx, const EventSink& sink) {
    for (const auto& child : sub_agents()) {
        if (ctx.end_invocation()) {
            return false;
        }
        if (!child->run(ctx, sink)) {
            return false;
        }
    }
    return true;
}

} // namespace agentrt
