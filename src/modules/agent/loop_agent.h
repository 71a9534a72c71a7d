// modules/agent/loop_agent.h
#ifndef AGENTRT_MODULES_AGENT_LOOP_AGENT_H
#define AGENTRT_MODULES_AGENT_LOOP_AGENT_H

#include "agent/base_agent.h"
#include <optional>

namespace agentrt {

// Repeats the children in order until max_iterations is reached or an event
// with actions.escalate is committed. Escalation ends the loop immediately:
// no later child of that iteration runs.
class LoopAgent : public BaseAgent {
public:
    LoopAgent(std::string name,
              std::vector<AgentPtr> sub_agents,
              std::optional<int> max_iterations = std::nullopt,
              std::string description = "");

    const std::optional<int>& max_iterations() const { return max_iterations_; }

protected:
    bool run_impl(InvocationContext& ctx, const EventSink& sink) override;

private:
    std::optional<int> max_iterations_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_AGENT_LOOP_AGENT_H
