// modules/agent/invocation_context.cpp
#include "agent/invocation_context.h"
#include "agent/base_agent.h"
#include "core/types/errors.h"

namespace agentrt {

InvocationContext::InvocationContext(std::string invocation_id,
                                     SessionPtr session,
                                     SessionStore& session_store,
                                     BaseAgent& agent,
                                     std::optional<Content> user_content,
                                     RunConfig run_config,
                                     ArtifactStore* artifact_store,
                                     MemoryStore* memory_store)
    : invocation_id_(std::move(invocation_id)),
      session_(std::move(session)),
      session_store_(&session_store),
      artifact_store_(artifact_store),
      memory_store_(memory_store),
      agent_(&agent),
      user_content_(std::move(user_content)),
      run_config_(run_config),
      shared_(std::make_shared<Shared>(run_config_, invocation_id_)) {
    if (!session_) {
        throw Error("InvocationContext requires a session");
    }
}

InvocationContext InvocationContext::for_agent(BaseAgent& agent) const {
    InvocationContext derived(*this);
    derived.agent_ = &agent;
    return derived;
}

InvocationContext InvocationContext::for_branch(BaseAgent& agent, std::string branch) const {
    InvocationContext derived(*this);
    derived.agent_ = &agent;
    derived.branch_ = std::move(branch);
    return derived;
}

// ————————————————————————————————————————

CallbackContext::CallbackContext(InvocationContext& ctx) : ctx_(ctx) {}

const std::string& CallbackContext::agent_name() const {
    return ctx_.agent().name();
}

ArtifactStore& CallbackContext::require_artifact_store() {
    if (!ctx_.artifact_store()) {
        throw Error("Artifact store is not configured");
    }
    return *ctx_.artifact_store();
}

int CallbackContext::save_artifact(const std::string& filename, const Part& artifact) {
    int version = require_artifact_store().save_artifact(ctx_.app_name(), ctx_.user_id(), ctx_.session()->id(),
                                                         filename, artifact);
    actions_.artifact_delta[filename] = version;
    return version;
}

std::optional<Part> CallbackContext::load_artifact(const std::string& filename, std::optional<int> version) {
    return require_artifact_store().load_artifact(ctx_.app_name(), ctx_.user_id(), ctx_.session()->id(),
                                                  filename, version);
}

std::vector<std::string> CallbackContext::list_artifacts() {
    return require_artifact_store().list_artifact_keys(ctx_.app_name(), ctx_.user_id(), ctx_.session()->id());
}

// ————————————————————————————————————————

ToolContext::ToolContext(InvocationContext& ctx, std::string function_call_id)
    : CallbackContext(ctx), function_call_id_(std::move(function_call_id)) {}

std::vector<MemoryEntry> ToolContext::search_memory(const std::string& query) {
    if (!ctx_.memory_store()) {
        throw Error("Memory store is not configured");
    }
    return ctx_.memory_store()->search_memory(ctx_.app_name(), ctx_.user_id(), query);
}

} // namespace agentrt
