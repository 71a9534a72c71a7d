// modules/memory/memory_store.h
#ifndef AGENTRT_MODULES_MEMORY_MEMORY_STORE_H
#define AGENTRT_MODULES_MEMORY_MEMORY_STORE_H

#include "core/types/content.h"
#include <string>
#include <vector>

namespace agentrt {

struct MemoryEntry {
    Content content;
    std::string author;
    double timestamp = 0.0;
    double score = 0.0; // filled by search
};

// Long-term recall across sessions. The runtime only reads from it.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    // Best match first
    virtual std::vector<MemoryEntry> search_memory(const std::string& app_name,
                                                   const std::string& user_id,
                                                   const std::string& query) = 0;
};

} // namespace agentrt

#endif // AGENTRT_MODULES_MEMORY_MEMORY_STORE_H
