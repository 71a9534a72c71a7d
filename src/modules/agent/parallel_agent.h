// modules/agent/parallel_agent.h
#ifndef AGENTRT_MODULES_AGENT_PARALLEL_AGENT_H
#define AGENTRT_MODULES_AGENT_PARALLEL_AGENT_H

#include "agent/base_agent.h"

namespace agentrt {

// Runs every child on its own thread with branch "<base>.<child>", where base is
// the current branch or this agent's name at the top level. Events reach the
// sink one at a time in completion order. If any child fails, the siblings are
// still awaited and a ParallelAgentError naming the failed branches is thrown.
class ParallelAgent : public BaseAgent {
public:
    ParallelAgent(std::string name, std::vector<AgentPtr> sub_agents, std::string description = "");

protected:
    bool run_impl(InvocationContext& ctx, const EventSink& sink) override;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_AGENT_PARALLEL_AGENT_H
