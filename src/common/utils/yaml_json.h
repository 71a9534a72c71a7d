#ifndef AGENTRT_COMMON_UTILS_YAML_JSON_H
#define AGENTRT_COMMON_UTILS_YAML_JSON_H

#include "core/types/value.h"
#include <yaml-cpp/yaml.h>
#include <string>

namespace agentrt {

// 将 YAML::Node 转换为 nlohmann::json
// Plain scalars are typed (bool, null, integer, float); quoted scalars stay strings.
Value yaml_to_json(const YAML::Node& node);

// Parses a YAML document from disk. Throws ConfigError on I/O or syntax errors.
Value load_yaml_file(const std::string& path);

// Same for an in-memory document
Value parse_yaml(const std::string& text);

} // namespace agentrt

#endif // AGENTRT_COMMON_UTILS_YAML_JSON_H
