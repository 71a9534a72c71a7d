// modules/runner/runner.h
#ifndef AGENTRT_MODULES_RUNNER_RUNNER_H
#define AGENTRT_MODULES_RUNNER_RUNNER_H

#include "agent/base_agent.h"
#include "agent/invocation_context.h"
#include "artifact/artifact_store.h"
#include "memory/memory_store.h"
#include "runner/event_stream.h"
#include "session/session_store.h"
#include "trace/trace_exporter.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentrt {

// Drives one root agent for one app. For every emitted event: commit through
// the session store (non-partial only), hand it to the consumer, and only then
// let the agent continue.
class Runner {
public:
    Runner(std::string app_name,
           AgentPtr root_agent,
           std::shared_ptr<SessionStore> session_store,
           std::shared_ptr<ArtifactStore> artifact_store = nullptr,
           std::shared_ptr<MemoryStore> memory_store = nullptr);
    virtual ~Runner() = default;

    // Push surface. The session is created when it does not exist yet. Agent
    // failures are logged and reported in the result; committed state is kept.
    RunResult run(const std::string& user_id,
                  const std::string& session_id,
                  const Content& new_message,
                  const EventConsumer& consumer = nullptr,
                  const RunConfig& config = {});

    // Pull surface, see EventStream
    EventStream run_stream(const std::string& user_id,
                           const std::string& session_id,
                           Content new_message,
                           RunConfig config = {});

    // Trace of the most recently finished invocation
    std::vector<TraceRecord> last_traces() const;

    const std::string& app_name() const { return app_name_; }
    BaseAgent& root_agent() const { return *root_agent_; }
    SessionStore& session_store() const { return *session_store_; }
    ArtifactStore* artifact_store() const { return artifact_store_.get(); }
    MemoryStore* memory_store() const { return memory_store_.get(); }

private:
    SessionPtr resolve_session(const std::string& user_id, const std::string& session_id);

    std::string app_name_;
    AgentPtr root_agent_;
    std::shared_ptr<SessionStore> session_store_;
    std::shared_ptr<ArtifactStore> artifact_store_;
    std::shared_ptr<MemoryStore> memory_store_;

    mutable std::mutex traces_mutex_;
    std::vector<TraceRecord> last_traces_;
};

// Runner wired to volatile session, artifact and memory stores
class InMemoryRunner : public Runner {
public:
    explicit InMemoryRunner(AgentPtr root_agent, std::string app_name = "InMemoryRunner");
};

} // namespace agentrt

#endif // AGENTRT_MODULES_RUNNER_RUNNER_H
