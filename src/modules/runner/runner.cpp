// modules/runner/runner.cpp
#include "runner/runner.h"
#include "artifact/in_memory_artifact_store.h"
#include "common/logging/logger.h"
#include "common/utils/ids.h"
#include "core/types/errors.h"
#include "memory/in_memory_memory_store.h"
#include "session/in_memory_session_store.h"

namespace agentrt {

Runner::Runner(std::string app_name,
               AgentPtr root_agent,
               std::shared_ptr<SessionStore> session_store,
               std::shared_ptr<ArtifactStore> artifact_store,
               std::shared_ptr<MemoryStore> memory_store)
    : app_name_(std::move(app_name)),
      root_agent_(std::move(root_agent)),
      session_store_(std::move(session_store)),
      artifact_store_(std::move(artifact_store)),
      memory_store_(std::move(memory_store)) {
    if (!root_agent_) {
        throw ConfigError("Runner requires a root agent");
    }
    if (!session_store_) {
        throw ConfigError("Runner requires a session store");
    }
}

SessionPtr Runner::resolve_session(const std::string& user_id, const std::string& session_id) {
    SessionPtr session = session_store_->get_session(app_name_, user_id, session_id);
    if (session) {
        return session;
    }
    AGENTRT_LOG_INFO("Creating session {} for user {}", session_id, user_id);
    return session_store_->create_session(app_name_, user_id, session_id);
}

RunResult Runner::run(const std::string& user_id,
                      const std::string& session_id,
                      const Content& new_message,
                      const EventConsumer& consumer,
                      const RunConfig& config) {
    RunResult result;
    result.invocation_id = "e-" + new_uuid();

    // 1. 初始化：解析会话，提交用户输入
    SessionPtr session;
    try {
        session = resolve_session(user_id, session_id);
        result.session = session;

        if (!new_message.empty()) {
            Event user_event = Event::create(result.invocation_id, "user");
            user_event.content = new_message;
            if (user_event.content->role.empty()) user_event.content->role = "user";
            result.committed_events.push_back(session_store_->append_event(*session, user_event));
        }
    } catch (const std::exception& e) {
        AGENTRT_LOG_ERROR("Invocation {} could not start: {}", result.invocation_id, e.what());
        result.message = e.what();
        return result;
    }

    InvocationContext ctx(result.invocation_id, session, *session_store_, *root_agent_,
                          new_message.empty() ? std::nullopt : std::optional<Content>(new_message),
                          config, artifact_store_.get(), memory_store_.get());

    AGENTRT_LOG_INFO("Invocation {} started: app={} user={} session={} agent={}",
                     result.invocation_id, app_name_, user_id, session_id, root_agent_->name());

    // 2. 提交后再恢复：事件先持久化，再交给调用方，最后才返回给 agent
    bool terminated = false;
    EventSink commit_sink = [&](const Event& event) -> bool {
        if (terminated) {
            AGENTRT_LOG_WARN("Rejected event {} from '{}' emitted after termination", event.id, event.author);
            return false;
        }
        if (event.partial) {
            const bool keep = consumer ? consumer(event) : true;
            if (!keep || ctx.end_invocation()) terminated = true;
            return !terminated;
        }

        Event committed = session_store_->append_event(*session, event);
        result.committed_events.push_back(committed);

        const bool keep = consumer ? consumer(committed) : true;
        if (!keep || ctx.end_invocation()) terminated = true;
        return !terminated;
    };

    // 3. 执行根 agent
    try {
        const bool completed = root_agent_->run(ctx, commit_sink) && !terminated && !ctx.end_invocation();
        terminated = true;
        result.success = true;
        result.message = completed ? "Invocation completed" : "Invocation ended early";
        AGENTRT_LOG_INFO("Invocation {} finished with {} committed events",
                         result.invocation_id, result.committed_events.size());
    } catch (const std::exception& e) {
        terminated = true;
        result.success = false;
        result.message = e.what();
        AGENTRT_LOG_ERROR("Invocation {} failed: {}", result.invocation_id, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(traces_mutex_);
        last_traces_ = ctx.trace().get_traces();
    }
    return result;
}

EventStream Runner::run_stream(const std::string& user_id,
                               const std::string& session_id,
                               Content new_message,
                               RunConfig config) {
    return EventStream([this, user_id, session_id, message = std::move(new_message), config](const EventConsumer& consumer) {
        return run(user_id, session_id, message, consumer, config);
    });
}

std::vector<TraceRecord> Runner::last_traces() const {
    std::lock_guard<std::mutex> lock(traces_mutex_);
    return last_traces_;
}

// ————————————————————————————————————————

InMemoryRunner::InMemoryRunner(AgentPtr root_agent, std::string app_name)
    : Runner(std::move(app_name),
             std::move(root_agent),
             std::make_shared<InMemorySessionStore>(),
             std::make_shared<InMemoryArtifactStore>(),
             std::make_shared<InMemoryMemoryStore>()) {}

} // namespace agentrt
