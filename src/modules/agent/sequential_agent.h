// modules/agent/sequential_agent.h
#ifndef AGENTRT_MODULES_AGENT_SEQUENTIAL_AGENT_H
#define AGENTRT_MODULES_AGENT_SEQUENTIAL_AGENT_H

#include "agent/base_agent.h"

namespace agentrt {

// Runs the children once, in order, on the same context
class SequentialAgent : public BaseAgent {
public:
    SequentialAgent(std::string name, std::vector<AgentPtr> sub_agents, std::string description = "");

protected:
    bool run_impl(InvocationContext& ctx, const EventSink& sink) override;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_AGENT_SEQUENTIAL_AGENT_H
