// modules/agent/base_agent.cpp
#include "agent/base_agent.h"
#include "common/logging/logger.h"
#include "core/types/errors.h"
#include <set>

namespace agentrt {

const char* agent_kind_to_string(AgentKind kind) {
    switch (kind) {
        case AgentKind::LLM: return "llm";
        case AgentKind::SEQUENTIAL: return "sequential";
        case AgentKind::PARALLEL: return "parallel";
        case AgentKind::LOOP: return "loop";
        case AgentKind::CUSTOM: return "custom";
    }
    return "unknown";
}

BaseAgent::BaseAgent(std::string name, AgentKind kind, std::string description, std::vector<AgentPtr> sub_agents)
    : name_(std::move(name)), kind_(kind), description_(std::move(description)) {
    if (name_.empty()) {
        throw ConfigError("Agent name must not be empty");
    }
    if (name_ == "user") {
        throw ConfigError("Agent name 'user' is reserved for end-user input");
    }

    std::set<std::string> seen;
    for (auto& child : sub_agents) {
        if (!child) {
            throw ConfigError("Agent '" + name_ + "' was given a null sub-agent");
        }
        if (child->parent_ != nullptr) {
            throw ConfigError("Agent '" + child->name() + "' already has a parent agent '" +
                              child->parent_->name() + "', cannot add to '" + name_ + "'");
        }
        if (!seen.insert(child->name()).second) {
            throw ConfigError("Agent '" + name_ + "' has duplicate sub-agent name '" + child->name() + "'");
        }
    }
    // 全部检查通过后再挂接，避免部分挂接
    for (auto& child : sub_agents) {
        child->parent_ = this;
    }
    sub_agents_ = std::move(sub_agents);
}

BaseAgent& BaseAgent::root_agent() {
    BaseAgent* agent = this;
    while (agent->parent_) {
        agent = agent->parent_;
    }
    return *agent;
}

BaseAgent* BaseAgent::find_agent(const std::string& name) {
    if (name_ == name) return this;
    return find_sub_agent(name);
}

BaseAgent* BaseAgent::find_sub_agent(const std::string& name) {
    for (auto& child : sub_agents_) {
        if (BaseAgent* found = child->find_agent(name)) {
            return found;
        }
    }
    return nullptr;
}

void BaseAgent::add_before_agent_callback(BeforeAgentCallback callback) {
    before_agent_callbacks_.push_back(std::move(callback));
}

void BaseAgent::add_after_agent_callback(AfterAgentCallback callback) {
    after_agent_callbacks_.push_back(std::move(callback));
}

bool BaseAgent::run(InvocationContext& parent_ctx, const EventSink& sink) {
    InvocationContext ctx = parent_ctx.for_agent(*this);
    TraceExporter& trace = ctx.trace();
    const size_t record = trace.on_agent_start(name_, agent_kind_to_string(kind_), ctx.branch());

    int emitted = 0;
    EventSink counting_sink = [&](const Event& event) {
        ++emitted;
        return sink(event);
    };

    try {
        // 1. before_agent 回调，可短路本 agent
        if (auto decided = handle_before_agent(ctx, counting_sink)) {
            trace.on_agent_end(record, *decided ? "skipped" : "cancelled", emitted, std::nullopt, ctx.budget().snapshot());
            return *decided;
        }
        if (ctx.end_invocation()) {
            trace.on_agent_end(record, "cancelled", emitted, std::nullopt, ctx.budget().snapshot());
            return false;
        }

        // 2. 执行主体
        bool keep = run_impl(ctx, counting_sink);

        // 3. after_agent 回调
        if (keep && !ctx.end_invocation()) {
            keep = handle_after_agent(ctx, counting_sink);
        }

        trace.on_agent_end(record, keep ? "success" : "cancelled", emitted, std::nullopt, ctx.budget().snapshot());
        return keep;
    } catch (const std::exception& e) {
        trace.on_agent_end(record, "failed", emitted, std::string(e.what()), ctx.budget().snapshot());
        AGENTRT_LOG_DEBUG("Agent '{}' failed on branch '{}': {}", name_, ctx.branch(), e.what());
        throw;
    }
}

std::optional<bool> BaseAgent::handle_before_agent(InvocationContext& ctx, const EventSink& sink) {
    if (before_agent_callbacks_.empty()) {
        return std::nullopt;
    }

    CallbackContext callback_ctx(ctx);
    std::optional<Content> content = run_callback_chain(before_agent_callbacks_, callback_ctx);

    if (content) {
        AGENTRT_LOG_DEBUG("before_agent callback short-circuited agent '{}'", name_);
        Event event = Event::create(ctx.invocation_id(), name_, ctx.branch());
        if (content->role.empty()) content->role = "model";
        event.content = std::move(*content);
        event.actions = callback_ctx.actions();
        return sink(event);
    }

    if (!callback_ctx.actions().empty()) {
        Event event = Event::create(ctx.invocation_id(), name_, ctx.branch());
        event.actions = callback_ctx.actions();
        if (!sink(event)) {
            return false;
        }
    }
    return std::nullopt;
}

bool BaseAgent::handle_after_agent(InvocationContext& ctx, const EventSink& sink) {
    if (after_agent_callbacks_.empty()) {
        return true;
    }

    CallbackContext callback_ctx(ctx);
    std::optional<Content> content = run_callback_chain(after_agent_callbacks_, callback_ctx);

    if (!content && callback_ctx.actions().empty()) {
        return true;
    }

    Event event = Event::create(ctx.invocation_id(), name_, ctx.branch());
    if (content) {
        if (content->role.empty()) content->role = "model";
        event.content = std::move(*content);
    }
    event.actions = callback_ctx.actions();
    return sink(event);
}

} // namespace agentrt
