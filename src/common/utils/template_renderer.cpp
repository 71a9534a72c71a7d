// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include "modules/state/state.h"
#include <filesystem>
#include <mutex>

namespace agentrt {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    env_.set_trim_blocks(true);

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& context) {
    // Shared default environment; parallel branches render concurrently
    static InjaTemplateRenderer renderer;
    static std::mutex render_mutex;
    std::lock_guard<std::mutex> lock(render_mutex);
    try {
        return renderer.env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw Error("Template render error: " + std::string(e.message));
    }
}

Value build_template_context(const StateMap& state) {
    Value ctx = Value::object();
    Value app = Value::object();
    Value user = Value::object();
    Value temp = Value::object();

    if (state.is_object()) {
        for (auto it = state.begin(); it != state.end(); ++it) {
            switch (scope_of(it.key())) {
                case StateScope::APP: app[strip_scope_prefix(it.key())] = it.value(); break;
                case StateScope::USER: user[strip_scope_prefix(it.key())] = it.value(); break;
                case StateScope::TEMP: temp[strip_scope_prefix(it.key())] = it.value(); break;
                case StateScope::SESSION: ctx[it.key()] = it.value(); break;
            }
        }
    }
    ctx["app"] = std::move(app);
    ctx["user"] = std::move(user);
    ctx["temp"] = std::move(temp);
    ctx["state"] = state.is_object() ? state : StateMap::object();
    return ctx;
}

} // namespace agentrt
