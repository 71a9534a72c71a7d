// modules/loader/agent_loader.cpp
#include "loader/agent_loader.h"
#include "agent/llm_agent.h"
#include "agent/loop_agent.h"
#include "agent/parallel_agent.h"
#include "agent/sequential_agent.h"
#include "common/logging/logger.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <cstdint>
#include <limits>

namespace agentrt {

namespace {

std::string string_field(const Value& def, const char* key, const std::string& agent) {
    if (!def.contains(key) || def[key].is_null()) return "";
    if (!def[key].is_string()) {
        throw ConfigError("Agent '" + agent + "': field '" + key + "' must be a string");
    }
    return def[key].get<std::string>();
}

} // namespace

AgentLoader::AgentLoader(ModelResolver model_resolver, std::shared_ptr<ToolRegistry> tool_registry)
    : model_resolver_(std::move(model_resolver)), tool_registry_(std::move(tool_registry)) {
    if (!tool_registry_) {
        tool_registry_ = std::make_shared<ToolRegistry>();
    }
}

AgentPtr AgentLoader::load_file(const std::string& path) const {
    AGENTRT_LOG_INFO("Loading agent definitions from {}", path);
    return build(load_yaml_file(path));
}

AgentPtr AgentLoader::load_string(const std::string& yaml) const {
    return build(parse_yaml(yaml));
}

AgentPtr AgentLoader::build(const Value& def) const {
    if (!def.is_object()) {
        throw ConfigError("Agent definition must be a mapping");
    }
    const std::string name = string_field(def, "name", "<unnamed>");
    if (name.empty()) {
        throw ConfigError("Agent definition is missing 'name'");
    }
    const std::string type = string_field(def, "type", name);
    const std::string description = string_field(def, "description", name);

    if (type == "llm") {
        return build_llm(def, name);
    }
    if (type == "sequential") {
        return std::make_shared<SequentialAgent>(name, build_children(def, name), description);
    }
    if (type == "parallel") {
        return std::make_shared<ParallelAgent>(name, build_children(def, name), description);
    }
    if (type == "loop") {
        std::optional<int> max_iterations;
        if (def.contains("max_iterations") && !def["max_iterations"].is_null()) {
            if (!def["max_iterations"].is_number_integer()) {
                throw ConfigError("Agent '" + name + "': max_iterations must be an integer");
            }
            const Value& raw = def["max_iterations"];
            const bool in_range = raw.is_number_unsigned()
                ? raw.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                : raw.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  raw.get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range) {
                throw ConfigError("Agent '" + name + "': max_iterations is out of range");
            }
            max_iterations = static_cast<int>(raw.get<std::int64_t>());
        }
        return std::make_shared<LoopAgent>(name, build_children(def, name), max_iterations, description);
    }
    if (type.empty()) {
        throw ConfigError("Agent '" + name + "' is missing 'type'");
    }
    throw ConfigError("Agent '" + name + "' has unknown type '" + type + "'");
}

std::vector<AgentPtr> AgentLoader::build_children(const Value& def, const std::string& name) const {
    std::vector<AgentPtr> children;
    if (!def.contains("sub_agents") || def["sub_agents"].is_null()) {
        return children;
    }
    if (!def["sub_agents"].is_array()) {
        throw ConfigError("Agent '" + name + "': sub_agents must be a list");
    }
    for (const auto& child : def["sub_agents"]) {
        children.push_back(build(child));
    }
    return children;
}

AgentPtr AgentLoader::build_llm(const Value& def, const std::string& name) const {
    if (def.contains("sub_agents") && !def["sub_agents"].is_null() && !def["sub_agents"].empty()) {
        throw ConfigError("Agent '" + name + "': llm agents cannot have sub_agents");
    }

    LlmAgent::Config config;
    config.name = name;
    config.description = string_field(def, "description", name);
    config.instruction = string_field(def, "instruction", name);

    // 1. 模型
    const std::string model_name = string_field(def, "model", name);
    config.model = model_resolver_ ? model_resolver_(model_name) : nullptr;
    if (!config.model) {
        throw ConfigError("Agent '" + name + "' references unknown model '" + model_name + "'");
    }

    // 2. 工具
    config.tool_registry = tool_registry_;
    if (def.contains("tools") && !def["tools"].is_null()) {
        if (!def["tools"].is_array()) {
            throw ConfigError("Agent '" + name + "': tools must be a list");
        }
        for (const auto& tool : def["tools"]) {
            if (!tool.is_string()) {
                throw ConfigError("Agent '" + name + "': tool names must be strings");
            }
            const std::string tool_name = tool.get<std::string>();
            if (!tool_registry_->has_tool(tool_name)) {
                throw ConfigError("Agent '" + name + "' references unknown tool '" + tool_name + "'");
            }
            config.tools.push_back(tool_name);
        }
    }

    // 3. 其他
    const std::string output_key = string_field(def, "output_key", name);
    if (!output_key.empty()) {
        config.output_key = output_key;
    }
    if (def.contains("include_contents")) {
        const Value& include = def["include_contents"];
        if (include.is_boolean()) {
            config.include_contents = include.get<bool>();
        } else if (include.is_string() && (include == "default" || include == "none")) {
            config.include_contents = include == "default";
        } else {
            throw ConfigError("Agent '" + name + "': include_contents must be 'default', 'none' or a boolean");
        }
    }

    return std::make_shared<LlmAgent>(std::move(config));
}

} // namespace agentrt
