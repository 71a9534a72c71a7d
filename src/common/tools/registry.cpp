// common/tools/registry.cpp
#include "common/tools/registry.h"
#include "core/types/errors.h"
#include "modules/agent/invocation_context.h"

namespace agentrt {

ToolRegistry::ToolRegistry() {
    register_default_tools();
}

void ToolRegistry::register_default_tools() {
    register_tool(
        ToolDeclaration{kExitLoop,
                        "Call this only when the task is complete to stop the enclosing loop.",
                        Value{{"type", "object"}, {"properties", Value::object()}}},
        [](const Value&, ToolContext& ctx) -> Value {
            ctx.actions().escalate = true;
            ctx.actions().skip_downstream_processing = true;
            return Value::object();
        });
}

void ToolRegistry::register_tool(ToolDeclaration declaration, ToolFunction func) {
    if (declaration.name.empty()) {
        throw ToolError("Tool name must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = declaration.name;
    tools_[name] = Entry{std::move(declaration), std::move(func)};
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

Value ToolRegistry::call_tool(const std::string& name, const Value& args, ToolContext& ctx) const {
    ToolFunction func;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw ToolError("Tool not found: " + name);
        }
        func = it->second.func;
    }

    try {
        return func(args, ctx);
    } catch (const ToolError&) {
        throw;
    } catch (const std::exception& e) {
        throw ToolError("Tool " + name + " execution failed: " + e.what());
    }
}

std::vector<ToolDeclaration> ToolRegistry::declarations(const std::vector<std::string>& names) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDeclaration> decls;
    for (const auto& name : names) {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw ToolError("Tool not found: " + name);
        }
        decls.push_back(it->second.declaration);
    }
    return decls;
}

} // namespace agentrt
