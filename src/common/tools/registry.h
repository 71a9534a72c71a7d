// common/tools/registry.h
#ifndef AGENTRT_COMMON_TOOLS_REGISTRY_H
#define AGENTRT_COMMON_TOOLS_REGISTRY_H

#include "common/llm/model_client.h"
#include "core/types/value.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace agentrt {

class ToolContext;

// Tool bodies receive the parsed arguments and the context of the calling agent
// (state, artifacts, memory, actions). The returned value becomes the function
// response.
using ToolFunction = std::function<Value(const Value& args, ToolContext& ctx)>;

class ToolRegistry {
public:
    ToolRegistry(); // 构造时注册内置工具 exit_loop

    void register_tool(ToolDeclaration declaration, ToolFunction func);

    bool has_tool(const std::string& name) const;

    // Unknown tool and exceptions thrown by the tool surface as ToolError
    Value call_tool(const std::string& name, const Value& args, ToolContext& ctx) const;

    // Declarations of the named tools; throws ToolError for unknown names
    std::vector<ToolDeclaration> declarations(const std::vector<std::string>& names) const;

    static constexpr const char* kExitLoop = "exit_loop";

private:
    void register_default_tools();

    struct Entry {
        ToolDeclaration declaration;
        ToolFunction func;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> tools_;
};

} // namespace agentrt

#endif // AGENTRT_COMMON_TOOLS_REGISTRY_H
