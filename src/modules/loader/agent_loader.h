// modules/loader/agent_loader.h
#ifndef AGENTRT_MODULES_LOADER_AGENT_LOADER_H
#define AGENTRT_MODULES_LOADER_AGENT_LOADER_H

#include "agent/base_agent.h"
#include "common/llm/model_client.h"
#include "common/tools/registry.h"
#include "core/types/value.h"
#include <functional>
#include <memory>
#include <string>

namespace agentrt {

// Maps the `model` field of a definition to a client. An empty name asks for the
// default model; returning nullptr marks the name as unknown.
using ModelResolver = std::function<std::shared_ptr<ModelClient>(const std::string& model_name)>;

// Builds agent trees from YAML definitions:
//
//   name: doc_pipeline
//   type: sequential            # llm | sequential | parallel | loop
//   sub_agents:
//     - name: writer
//       type: llm
//       instruction: "Write about {{ topic }}"
//       output_key: draft
//       tools: [exit_loop]
//
// Every error is a ConfigError naming the offending agent.
class AgentLoader {
public:
    AgentLoader(ModelResolver model_resolver, std::shared_ptr<ToolRegistry> tool_registry);

    AgentPtr load_file(const std::string& path) const;
    AgentPtr load_string(const std::string& yaml) const;

    AgentPtr build(const Value& definition) const;

private:
    AgentPtr build_llm(const Value& def, const std::string& name) const;
    std::vector<AgentPtr> build_children(const Value& def, const std::string& name) const;

    ModelResolver model_resolver_;
    std::shared_ptr<ToolRegistry> tool_registry_;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_LOADER_AGENT_LOADER_H
