// modules/config/app_config.h
#ifndef AGENTRT_MODULES_CONFIG_APP_CONFIG_H
#define AGENTRT_MODULES_CONFIG_APP_CONFIG_H

#include "agent/invocation_context.h"
#include "common/logging/logger.h"
#include "core/types/value.h"
#include "session/session_store.h"
#include <memory>
#include <optional>
#include <string>

namespace agentrt {

struct SessionStoreConfig {
    std::string backend = "memory"; // "memory" | "sqlite"
    std::string path = "sessions.db";
};

struct LlmConfig {
    std::string model_path;
    int n_ctx = 2048;
    int n_threads = 4;
    float temperature = 0.7f;
    float min_p = 0.05f;
    int n_predict = 512;
};

struct AppConfig {
    std::string app_name = "agentrt_app";
    LoggingConfig logging;
    SessionStoreConfig session_store;
    RunConfig run;
    std::optional<LlmConfig> llm;
    std::optional<std::string> agent_file;

    // Relative paths are resolved against the directory of `path`
    static AppConfig load(const std::string& path);
    // base_dir anchors relative paths; empty keeps them as written
    static AppConfig from_json(const Value& doc, const std::string& base_dir = "");
};

// Builds the backend named by config.backend. Throws ConfigError for unknown backends.
std::shared_ptr<SessionStore> make_session_store(const SessionStoreConfig& config);

} // namespace agentrt

#endif // AGENTRT_MODULES_CONFIG_APP_CONFIG_H
