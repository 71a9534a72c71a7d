// modules/artifact/in_memory_artifact_store.cpp
#include "artifact/in_memory_artifact_store.h"
#include <algorithm>

namespace agentrt {

namespace {

// Unit separator; app, user and session ids may contain '/'
constexpr char kSep = '\x1f';

std::string scope_prefix(const std::string& app_name, const std::string& user_id, const std::string& session_id) {
    std::string prefix;
    prefix.reserve(app_name.size() + user_id.size() + session_id.size() + 3);
    prefix.append(app_name).push_back(kSep);
    prefix.append(user_id).push_back(kSep);
    prefix.append(session_id).push_back(kSep);
    return prefix;
}

} // namespace

bool is_user_scoped_artifact(const std::string& filename) {
    return filename.starts_with("user:");
}

std::string InMemoryArtifactStore::artifact_path(const std::string& app_name, const std::string& user_id,
                                                 const std::string& session_id, const std::string& filename) {
    // user-scoped files live under an empty session segment
    return scope_prefix(app_name, user_id, is_user_scoped_artifact(filename) ? std::string() : session_id) + filename;
}

int InMemoryArtifactStore::save_artifact(const std::string& app_name, const std::string& user_id,
                                         const std::string& session_id, const std::string& filename,
                                         const Part& artifact) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& versions = artifacts_[artifact_path(app_name, user_id, session_id, filename)];
    versions.push_back(artifact);
    return static_cast<int>(versions.size()) - 1;
}

std::optional<Part> InMemoryArtifactStore::load_artifact(const std::string& app_name, const std::string& user_id,
                                                         const std::string& session_id, const std::string& filename,
                                                         std::optional<int> version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = artifacts_.find(artifact_path(app_name, user_id, session_id, filename));
    if (it == artifacts_.end() || it->second.empty()) {
        return std::nullopt;
    }
    const auto& versions = it->second;
    if (!version) {
        return versions.back();
    }
    if (*version < 0 || *version >= static_cast<int>(versions.size())) {
        return std::nullopt;
    }
    return versions[*version];
}

std::vector<std::string> InMemoryArtifactStore::list_artifact_keys(const std::string& app_name, const std::string& user_id,
                                                                   const std::string& session_id) {
    const std::string session_prefix = scope_prefix(app_name, user_id, session_id);
    const std::string user_prefix = scope_prefix(app_name, user_id, std::string());

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [path, versions] : artifacts_) {
        if (versions.empty()) continue;
        if (path.starts_with(session_prefix)) {
            keys.push_back(path.substr(session_prefix.size()));
        } else if (path.starts_with(user_prefix) && is_user_scoped_artifact(path.substr(user_prefix.size()))) {
            keys.push_back(path.substr(user_prefix.size()));
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<int> InMemoryArtifactStore::list_versions(const std::string& app_name, const std::string& user_id,
                                                      const std::string& session_id, const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> result;
    auto it = artifacts_.find(artifact_path(app_name, user_id, session_id, filename));
    if (it != artifacts_.end()) {
        for (size_t i = 0; i < it->second.size(); ++i) {
            result.push_back(static_cast<int>(i));
        }
    }
    return result;
}

void InMemoryArtifactStore::delete_artifact(const std::string& app_name, const std::string& user_id,
                                            const std::string& session_id, const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    artifacts_.erase(artifact_path(app_name, user_id, session_id, filename));
}

} // namespace agentrt
