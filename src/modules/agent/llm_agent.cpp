// modules/agent/llm_agent.cpp
#include "agent/llm_agent.h"
#include "common/logging/logger.h"
#include "common/utils/ids.h"
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <algorithm>

namespace agentrt {

namespace {

// An event belongs to the history of `branch` when it was produced on the same
// branch or on one of its ancestors. Sibling branches never see each other; an
// unbranched agent sees everything.
bool visible_on_branch(const std::string& event_branch, const std::string& branch) {
    if (branch.empty() || event_branch.empty() || event_branch == branch) return true;
    return branch.starts_with(event_branch + ".");
}

} // namespace

LlmAgent::LlmAgent(Config config)
    : BaseAgent(config.name, AgentKind::LLM, config.description),
      config_(std::move(config)) {
    if (!config_.model) {
        throw ConfigError("LLM agent '" + name() + "' has no model");
    }
    if (!config_.tools.empty() && !config_.tool_registry) {
        throw ConfigError("LLM agent '" + name() + "' lists tools but has no tool registry");
    }
    for (const auto& tool : config_.tools) {
        if (!config_.tool_registry->has_tool(tool)) {
            throw ConfigError("LLM agent '" + name() + "' references unknown tool '" + tool + "'");
        }
    }
}

void LlmAgent::add_before_model_callback(BeforeModelCallback callback) {
    before_model_callbacks_.push_back(std::move(callback));
}

void LlmAgent::add_after_model_callback(AfterModelCallback callback) {
    after_model_callbacks_.push_back(std::move(callback));
}

void LlmAgent::add_before_tool_callback(BeforeToolCallback callback) {
    before_tool_callbacks_.push_back(std::move(callback));
}

void LlmAgent::add_after_tool_callback(AfterToolCallback callback) {
    after_tool_callbacks_.push_back(std::move(callback));
}

LlmRequest LlmAgent::build_request(const InvocationContext& ctx) const {
    LlmRequest request;
    request.model = config_.model->name();
    if (!config_.instruction.empty()) {
        request.system_instruction =
            InjaTemplateRenderer::render(config_.instruction, build_template_context(ctx.session()->state()));
    }
    request.contents = build_contents(ctx);
    if (!config_.tools.empty()) {
        request.tools = config_.tool_registry->declarations(config_.tools);
    }
    return request;
}

std::vector<Content> LlmAgent::build_contents(const InvocationContext& ctx) const {
    std::vector<Content> contents;
    for (const auto& event : ctx.session()->events()) {
        if (!event.content || event.content->empty()) continue;
        if (!visible_on_branch(event.branch, ctx.branch())) continue;
        // include_contents=false: only the current invocation (user turn + own tool round trips)
        if (!config_.include_contents && event.invocation_id != ctx.invocation_id()) continue;

        if (event.author == "user" || event.author == name()) {
            contents.push_back(*event.content);
        } else {
            contents.push_back(foreign_event_as_context(event));
        }
    }
    return contents;
}

// Output of other agents is presented to the model as user-side context
Content LlmAgent::foreign_event_as_context(const Event& event) const {
    Content content;
    content.role = "user";
    content.parts.push_back(Part::from_text("For context:"));
    for (const auto& part : event.content->parts) {
        if (part.text) {
            content.parts.push_back(Part::from_text("[" + event.author + "] said: " + *part.text));
        } else if (part.function_call) {
            content.parts.push_back(Part::from_text("[" + event.author + "] called tool `" +
                                                    part.function_call->name + "` with parameters: " +
                                                    part.function_call->args.dump()));
        } else if (part.function_response) {
            content.parts.push_back(Part::from_text("[" + event.author + "] `" + part.function_response->name +
                                                    "` tool returned result: " +
                                                    part.function_response->response.dump()));
        }
    }
    return content;
}

bool LlmAgent::run_impl(InvocationContext& ctx, const EventSink& sink) {
    while (true) {
        if (ctx.end_invocation()) {
            return false;
        }

        // 1. 构造请求并调用模型
        LlmRequest request = build_request(ctx);
        CallbackContext callback_ctx(ctx);
        std::optional<LlmResponse> response = call_model(ctx, request, callback_ctx, sink);
        if (!response) {
            return false;
        }

        // 2. 模型结果事件
        Event event = Event::create(ctx.invocation_id(), name(), ctx.branch());
        event.content = std::move(response->content);
        event.error_code = std::move(response->error_code);
        event.error_message = std::move(response->error_message);
        event.actions = callback_ctx.actions();
        if (event.content) {
            if (event.content->role.empty()) event.content->role = "model";
            for (auto& part : event.content->parts) {
                if (part.function_call && part.function_call->id.empty()) {
                    part.function_call->id = "call-" + new_uuid();
                }
            }
        }

        const std::vector<FunctionCall> calls = event.function_calls();
        if (calls.empty() && config_.output_key && event.content && !event.error_code) {
            event.actions.state_delta[*config_.output_key] = event.text();
        }

        if (!sink(event)) {
            return false;
        }
        if (calls.empty() || event.error_code) {
            return true;
        }

        // 3. 工具调用，合并为一个 function response 事件
        Event responses = handle_function_calls(ctx, calls);
        if (!sink(responses)) {
            return false;
        }
        if (responses.actions.skip_downstream_processing) {
            return true;
        }
    }
}

std::optional<LlmResponse> LlmAgent::call_model(InvocationContext& ctx, LlmRequest& request,
                                                CallbackContext& callback_ctx, const EventSink& sink) {
    if (auto overridden = run_callback_chain(before_model_callbacks_, callback_ctx, request)) {
        AGENTRT_LOG_DEBUG("before_model callback replaced the model call of '{}'", name());
        return overridden;
    }

    ctx.budget().consume_llm_call();

    std::optional<LlmResponse> final_response;
    bool stopped = false;
    config_.model->generate_content(request, ctx.run_config().streaming, [&](const LlmResponse& r) {
        if (!r.partial) {
            final_response = r;
            return true;
        }
        Event partial = Event::create(ctx.invocation_id(), name(), ctx.branch());
        partial.partial = true;
        partial.content = r.content;
        if (!sink(partial)) {
            stopped = true;
            return false;
        }
        return true;
    });

    if (stopped) {
        return std::nullopt;
    }
    if (!final_response) {
        throw Error("Model '" + config_.model->name() + "' returned no final response");
    }

    const LlmResponse& produced = *final_response;
    if (auto replaced = run_callback_chain(after_model_callbacks_, callback_ctx, produced)) {
        AGENTRT_LOG_DEBUG("after_model callback replaced the response of '{}'", name());
        return replaced;
    }
    return final_response;
}

Event LlmAgent::handle_function_calls(InvocationContext& ctx, const std::vector<FunctionCall>& calls) {
    Event event = Event::create(ctx.invocation_id(), name(), ctx.branch());
    Content content;
    content.role = "user";

    for (const auto& call : calls) {
        ToolContext tool_ctx(ctx, call.id);
        Value args = call.args.is_null() ? Value::object() : call.args;

        std::optional<Value> result = run_callback_chain(before_tool_callbacks_, call.name, args, tool_ctx);
        if (!result) {
            const bool offered = std::find(config_.tools.begin(), config_.tools.end(), call.name) != config_.tools.end();
            if (!offered) {
                throw ToolError("Agent '" + name() + "' has no tool named '" + call.name + "'");
            }
            result = config_.tool_registry->call_tool(call.name, args, tool_ctx);
        } else {
            AGENTRT_LOG_DEBUG("before_tool callback skipped tool '{}' of '{}'", call.name, name());
        }

        const Value& produced = *result;
        if (auto altered = run_callback_chain(after_tool_callbacks_, call.name, args, tool_ctx, produced)) {
            result = std::move(altered);
        }

        Value response = result->is_object() ? *result : Value{{"result", *result}};
        content.parts.push_back(Part::from_function_response(FunctionResponse{call.id, call.name, std::move(response)}));
        event.actions.merge(tool_ctx.actions());
    }

    event.content = std::move(content);
    return event;
}

} // namespace agentrt
