// modules/agent/loop_agent.cpp
#include "agent/loop_agent.h"
#include "common/logging/logger.h"
#include "core/types/errors.h"

namespace agentrt {

LoopAgent::LoopAgent(std::string name,
                     std::vector<AgentPtr> sub_agents,
                     std::optional<int> max_iterations,
                     std::string description)
    : BaseAgent(std::move(name), AgentKind::LOOP, std::move(description), std::move(sub_agents)),
      max_iterations_(max_iterations) {
    if (max_iterations_ && *max_iterations_ < 0) {
        throw ConfigError("Loop agent '" + this->name() + "' has negative max_iterations");
    }
}

bool LoopAgent::run_impl(InvocationContext& ctx, const EventSink& sink) {
    if (sub_agents().empty()) {
        return true;
    }

    bool escalated = false;
    bool stopped = false;
    EventSink loop_sink = [&](const Event& event) {
        if (!sink(event)) {
            stopped = true;
            return false;
        }
        if (!event.partial && event.actions.escalate) {
            escalated = true;
            return false;
        }
        return true;
    };

    int iteration = 0;
    while (!max_iterations_ || iteration < *max_iterations_) {
        for (const auto& child : sub_agents()) {
            if (ctx.end_invocation()) {
                return false;
            }
            child->run(ctx, loop_sink);
            if (stopped) {
                return false;
            }
            if (escalated) {
                AGENTRT_LOG_DEBUG("Loop '{}' escalated by '{}' in iteration {}", name(), child->name(), iteration);
                return true;
            }
        }
        ++iteration;
    }
    return true;
}

} // namespace agentrt
