// modules/agent/invocation_context.h
#ifndef AGENTRT_MODULES_AGENT_INVOCATION_CONTEXT_H
#define AGENTRT_MODULES_AGENT_INVOCATION_CONTEXT_H

#include "artifact/artifact_store.h"
#include "budget/budget_controller.h"
#include "core/types/content.h"
#include "core/types/event.h"
#include "core/types/session.h"
#include "memory/memory_store.h"
#include "session/session_store.h"
#include "state/state.h"
#include "trace/trace_exporter.h"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

class BaseAgent;

struct RunConfig {
    int max_llm_calls = 500; // <= 0 means unlimited
    bool streaming = false;  // ask models for partial responses
};

// Everything a task unit needs during one invocation. Delegation derives new
// contexts that differ only in agent and branch; all other fields, including the
// end_invocation flag, budget and trace, are shared.
class InvocationContext {
public:
    InvocationContext(std::string invocation_id,
                      SessionPtr session,
                      SessionStore& session_store,
                      BaseAgent& agent,
                      std::optional<Content> user_content = std::nullopt,
                      RunConfig run_config = {},
                      ArtifactStore* artifact_store = nullptr,
                      MemoryStore* memory_store = nullptr);

    InvocationContext for_agent(BaseAgent& agent) const;
    InvocationContext for_branch(BaseAgent& agent, std::string branch) const;

    const std::string& invocation_id() const { return invocation_id_; }
    const SessionPtr& session() const { return session_; }
    SessionStore& session_store() const { return *session_store_; }
    ArtifactStore* artifact_store() const { return artifact_store_; }
    MemoryStore* memory_store() const { return memory_store_; }
    BaseAgent& agent() const { return *agent_; }
    const std::string& branch() const { return branch_; }
    const std::optional<Content>& user_content() const { return user_content_; }
    const RunConfig& run_config() const { return run_config_; }

    const std::string& app_name() const { return session_->app_name(); }
    const std::string& user_id() const { return session_->user_id(); }

    bool end_invocation() const { return shared_->end_invocation.load(); }
    void set_end_invocation() { shared_->end_invocation.store(true); }

    BudgetController& budget() const { return shared_->budget; }
    TraceExporter& trace() const { return shared_->trace; }

private:
    struct Shared {
        Shared(const RunConfig& config, const std::string& invocation_id)
            : budget(config.max_llm_calls), trace(invocation_id) {}

        std::atomic<bool> end_invocation{false};
        BudgetController budget;
        TraceExporter trace;
    };

    std::string invocation_id_;
    SessionPtr session_;
    SessionStore* session_store_;
    ArtifactStore* artifact_store_;
    MemoryStore* memory_store_;
    BaseAgent* agent_;
    std::string branch_;
    std::optional<Content> user_content_;
    RunConfig run_config_;
    std::shared_ptr<Shared> shared_;
};

// Handed to agent and model callbacks. Owns the actions the hook produces;
// state writes land in actions().state_delta and are committed with the
// event the hook causes.
class CallbackContext {
public:
    explicit CallbackContext(InvocationContext& ctx);
    virtual ~CallbackContext() = default;

    State state() { return State(*ctx_.session(), actions_.state_delta); }
    EventActions& actions() { return actions_; }
    const EventActions& actions() const { return actions_; }

    const std::string& agent_name() const;
    const std::string& invocation_id() const { return ctx_.invocation_id(); }
    const std::string& branch() const { return ctx_.branch(); }
    const std::optional<Content>& user_content() const { return ctx_.user_content(); }

    // Records the new version in actions().artifact_delta
    int save_artifact(const std::string& filename, const Part& artifact);
    std::optional<Part> load_artifact(const std::string& filename, std::optional<int> version = std::nullopt);
    std::vector<std::string> list_artifacts();

    InvocationContext& invocation_context() { return ctx_; }

protected:
    ArtifactStore& require_artifact_store();

    InvocationContext& ctx_;
    EventActions actions_;
};

// Context of one tool call
class ToolContext : public CallbackContext {
public:
    ToolContext(InvocationContext& ctx, std::string function_call_id);

    const std::string& function_call_id() const { return function_call_id_; }

    std::vector<MemoryEntry> search_memory(const std::string& query);

private:
    std::string function_call_id_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_AGENT_INVOCATION_CONTEXT_H
