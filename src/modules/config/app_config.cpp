// modules/config/app_config.cpp
#include "config/app_config.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include "session/in_memory_session_store.h"
#include "session/sqlite_session_store.h"
#include <filesystem>

namespace agentrt {

namespace {

std::string resolve_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || base_dir.empty() || path == ":memory:") return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

const Value& section(const Value& doc, const char* key) {
    static const Value empty = Value::object();
    if (!doc.contains(key) || doc[key].is_null()) return empty;
    if (!doc[key].is_object()) {
        throw ConfigError(std::string("Config section '") + key + "' must be a mapping");
    }
    return doc[key];
}

template <typename T>
T field(const Value& obj, const char* key, T fallback, const char* where) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    try {
        return obj[key].get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError(std::string("Config field '") + where + "." + key + "' has the wrong type");
    }
}

} // namespace

AppConfig AppConfig::from_json(const Value& doc, const std::string& base_dir) {
    if (!doc.is_object()) {
        throw ConfigError("Config document must be a mapping");
    }

    AppConfig config;
    config.app_name = field<std::string>(doc, "app_name", config.app_name, "root");
    if (config.app_name.empty()) {
        throw ConfigError("app_name must not be empty");
    }

    // 1. logging
    const Value& logging = section(doc, "logging");
    config.logging.level = field<std::string>(logging, "level", config.logging.level, "logging");
    config.logging.pattern = field<std::string>(logging, "pattern", config.logging.pattern, "logging");

    // 2. session_store
    const Value& store = section(doc, "session_store");
    config.session_store.backend = field<std::string>(store, "backend", config.session_store.backend, "session_store");
    config.session_store.path =
        resolve_path(field<std::string>(store, "path", config.session_store.path, "session_store"), base_dir);
    if (config.session_store.backend != "memory" && config.session_store.backend != "sqlite") {
        throw ConfigError("Unknown session_store backend: " + config.session_store.backend);
    }

    // 3. run
    const Value& run = section(doc, "run");
    config.run.max_llm_calls = field<int>(run, "max_llm_calls", config.run.max_llm_calls, "run");
    config.run.streaming = field<bool>(run, "streaming", config.run.streaming, "run");

    // 4. llm (optional)
    if (doc.contains("llm") && !doc["llm"].is_null()) {
        const Value& llm = section(doc, "llm");
        LlmConfig llm_config;
        llm_config.model_path = resolve_path(field<std::string>(llm, "model_path", "", "llm"), base_dir);
        if (llm_config.model_path.empty()) {
            throw ConfigError("llm.model_path is required when llm is configured");
        }
        llm_config.n_ctx = field<int>(llm, "n_ctx", llm_config.n_ctx, "llm");
        llm_config.n_threads = field<int>(llm, "n_threads", llm_config.n_threads, "llm");
        llm_config.temperature = field<float>(llm, "temperature", llm_config.temperature, "llm");
        llm_config.min_p = field<float>(llm, "min_p", llm_config.min_p, "llm");
        llm_config.n_predict = field<int>(llm, "n_predict", llm_config.n_predict, "llm");
        config.llm = llm_config;
    }

    // 5. agent_file (optional)
    if (doc.contains("agent_file") && !doc["agent_file"].is_null()) {
        config.agent_file = resolve_path(field<std::string>(doc, "agent_file", "", "root"), base_dir);
    }
    return config;
}

AppConfig AppConfig::load(const std::string& path) {
    Value doc = load_yaml_file(path);
    std::string base_dir = std::filesystem::path(path).parent_path().string();
    return from_json(doc, base_dir);
}

std::shared_ptr<SessionStore> make_session_store(const SessionStoreConfig& config) {
    if (config.backend == "memory") {
        return std::make_shared<InMemorySessionStore>();
    }
    if (config.backend == "sqlite") {
        return std::make_shared<SqliteSessionStore>(config.path);
    }
    throw ConfigError("Unknown session_store backend: " + config.backend);
}

} // namespace agentrt
