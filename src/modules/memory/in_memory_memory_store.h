// modules/memory/in_memory_memory_store.h
#ifndef AGENTRT_MODULES_MEMORY_IN_MEMORY_MEMORY_STORE_H
#define AGENTRT_MODULES_MEMORY_IN_MEMORY_MEMORY_STORE_H

#include "memory/memory_store.h"
#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace agentrt {

// Keyword-overlap ranking: score = matched query words / query words.
// Entries without any overlap are not returned.
class InMemoryMemoryStore : public MemoryStore {
public:
    void add_memories(const std::string& app_name, const std::string& user_id, std::vector<MemoryEntry> entries);

    std::vector<MemoryEntry> search_memory(const std::string& app_name,
                                           const std::string& user_id,
                                           const std::string& query) override;

private:
    static std::set<std::string> words_of(const std::string& text);

    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::vector<MemoryEntry>> entries_; // (app, user) -> entries
};

} // namespace agentrt

#endif // AGENTRT_MODULES_MEMORY_IN_MEMORY_MEMORY_STORE_H
