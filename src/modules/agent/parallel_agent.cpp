// modules/agent/parallel_agent.cpp
#include "agent/parallel_agent.h"
#include "core/types/errors.h"
#include <exception>
#include <mutex>
#include <thread>

namespace agentrt {

ParallelAgent::ParallelAgent(std::string name, std::vector<AgentPtr> sub_agents, std::string description)
    : BaseAgent(std::move(name), AgentKind::PARALLEL, std::move(description), std::move(sub_agents)) {}

bool ParallelAgent::run_impl(InvocationContext& ctx, const EventSink& sink) {
    const auto& children = sub_agents();
    if (children.empty()) {
        return true;
    }

    const std::string base = ctx.branch().empty() ? name() : ctx.branch();

    std::mutex sink_mutex;
    bool stopped = false;
    EventSink merged_sink = [&](const Event& event) {
        std::lock_guard<std::mutex> lock(sink_mutex);
        if (stopped) {
            return false;
        }
        if (!sink(event)) {
            stopped = true;
            return false;
        }
        return true;
    };

    std::vector<InvocationContext> branch_contexts;
    branch_contexts.reserve(children.size());
    for (const auto& child : children) {
        branch_contexts.push_back(ctx.for_branch(*child, base + "." + child->name()));
    }

    // 每个子 agent 一个线程；异常留待全部结束后统一上报
    std::vector<std::exception_ptr> errors(children.size());
    std::vector<std::thread> workers;
    workers.reserve(children.size());
    for (size_t i = 0; i < children.size(); ++i) {
        workers.emplace_back([&, i] {
            try {
                children[i]->run(branch_contexts[i], merged_sink);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::vector<ParallelAgentError::BranchFailure> failures;
    for (size_t i = 0; i < children.size(); ++i) {
        if (!errors[i]) continue;
        try {
            std::rethrow_exception(errors[i]);
        } catch (const std::exception& e) {
            failures.push_back({branch_contexts[i].branch(), e.what()});
        }
    }
    if (!failures.empty()) {
        throw ParallelAgentError(name(), std::move(failures));
    }
    return !stopped;
}

} // namespace agentrt
