// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <cctype>
#include <sstream>

namespace agentrt {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Integers, floats and scientific notation; the whole string must be consumed
bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

Value scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    // "!" 标签表示带引号的标量，保持字符串
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True") return true;
    if (s == "false" || s == "False") return false;
    if (s == "~" || s == "null" || s.empty()) return nullptr;

    if (is_numeric(s)) {
        try {
            if (is_integer(s)) {
                return std::stoll(s);
            }
            return std::stod(s);
        } catch (const std::out_of_range&) {
            // too large for a number, keep the text
        }
    }
    return s;
}

} // namespace

Value yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

Value load_yaml_file(const std::string& path) {
    try {
        return yaml_to_json(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load YAML file " + path + ": " + e.what());
    }
}

Value parse_yaml(const std::string& text) {
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse YAML: ") + e.what());
    }
}

} // namespace agentrt
