// common/llm/model_client.cpp
#include "common/llm/model_client.h"

namespace agentrt {

void to_json(Value& j, const ToolDeclaration& decl) {
    j = Value{{"name", decl.name}, {"description", decl.description}, {"parameters", decl.parameters}};
}

} // namespace agentrt
