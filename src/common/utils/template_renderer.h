#ifndef AGENTRT_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTRT_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/value.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace agentrt {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const Value& context);

private:
    inja::Environment env_;
    void configure_security(); // include 被禁用
};

// Template data for agent instructions built from a flattened session state:
//   {{ topic }}            session keys at top level
//   {{ user.name }}        user: keys, prefix stripped
//   {{ app.version }}      app: keys, prefix stripped
//   {{ temp.scratch }}     temp: keys, prefix stripped
//   {{ state["user:name"] }} the raw flattened map
// The scope objects shadow session keys of the same name.
Value build_template_context(const StateMap& state);

} // namespace agentrt

#endif // AGENTRT_COMMON_UTILS_TEMPLATE_RENDERER_H
