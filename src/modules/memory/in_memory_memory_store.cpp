// modules/memory/in_memory_memory_store.cpp
#include "memory/in_memory_memory_store.h"
#include <algorithm>
#include <cctype>

namespace agentrt {

std::set<std::string> InMemoryMemoryStore::words_of(const std::string& text) {
    std::set<std::string> words;
    std::string current;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            words.insert(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.insert(std::move(current));
    return words;
}

void InMemoryMemoryStore::add_memories(const std::string& app_name, const std::string& user_id, std::vector<MemoryEntry> entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = entries_[{app_name, user_id}];
    for (auto& e : entries) {
        bucket.push_back(std::move(e));
    }
}

std::vector<MemoryEntry> InMemoryMemoryStore::search_memory(const std::string& app_name,
                                                            const std::string& user_id,
                                                            const std::string& query) {
    const auto query_words = words_of(query);
    if (query_words.empty()) return {};

    std::vector<MemoryEntry> hits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find({app_name, user_id});
        if (it == entries_.end()) return {};

        for (const auto& entry : it->second) {
            const auto entry_words = words_of(entry.content.text());
            size_t matched = std::count_if(query_words.begin(), query_words.end(),
                                           [&](const std::string& w) { return entry_words.count(w) > 0; });
            if (matched == 0) continue;
            MemoryEntry hit = entry;
            hit.score = static_cast<double>(matched) / static_cast<double>(query_words.size());
            hits.push_back(std::move(hit));
        }
    }

    // 分数相同则按时间新的优先
    std::stable_sort(hits.begin(), hits.end(), [](const MemoryEntry& a, const MemoryEntry& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.timestamp > b.timestamp;
    });
    return hits;
}

} // namespace agentrt
