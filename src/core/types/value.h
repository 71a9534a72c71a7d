#ifndef AGENTRT_CORE_TYPES_VALUE_H
#define AGENTRT_CORE_TYPES_VALUE_H

#include <nlohmann/json.hpp>

namespace agentrt {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using StateMap = nlohmann::json; // always an object

// null inside a state_delta means "delete this key"
inline Value tombstone() { return Value(nullptr); }
inline bool is_tombstone(const Value& v) { return v.is_null(); }

} // namespace agentrt

#endif // AGENTRT_CORE_TYPES_VALUE_H
