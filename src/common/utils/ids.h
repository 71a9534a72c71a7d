#ifndef AGENTRT_COMMON_UTILS_IDS_H
#define AGENTRT_COMMON_UTILS_IDS_H

#include <string>

namespace agentrt {

// RFC4122 version 4 uuid, lowercase hex
std::string new_uuid();

// Wall clock in fractional seconds since the epoch
double now_seconds();

} // namespace agentrt

#endif // AGENTRT_COMMON_UTILS_IDS_H
