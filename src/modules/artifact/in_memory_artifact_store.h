// modules/artifact/in_memory_artifact_store.h
#ifndef AGENTRT_MODULES_ARTIFACT_IN_MEMORY_ARTIFACT_STORE_H
#define AGENTRT_MODULES_ARTIFACT_IN_MEMORY_ARTIFACT_STORE_H

#include "artifact/artifact_store.h"
#include <map>
#include <mutex>

namespace agentrt {

class InMemoryArtifactStore : public ArtifactStore {
public:
    int save_artifact(const std::string& app_name, const std::string& user_id, const std::string& session_id,
                      const std::string& filename, const Part& artifact) override;

    std::optional<Part> load_artifact(const std::string& app_name, const std::string& user_id,
                                      const std::string& session_id, const std::string& filename,
                                      std::optional<int> version = std::nullopt) override;

    std::vector<std::string> list_artifact_keys(const std::string& app_name, const std::string& user_id,
                                                const std::string& session_id) override;

    std::vector<int> list_versions(const std::string& app_name, const std::string& user_id,
                                   const std::string& session_id, const std::string& filename) override;

    void delete_artifact(const std::string& app_name, const std::string& user_id,
                         const std::string& session_id, const std::string& filename) override;

private:
    static std::string artifact_path(const std::string& app_name, const std::string& user_id,
                                     const std::string& session_id, const std::string& filename);

    std::mutex mutex_;
    std::map<std::string, std::vector<Part>> artifacts_; // path -> versions
};

} // namespace agentrt

#endif // AGENTRT_MODULES_ARTIFACT_IN_MEMORY_ARTIFACT_STORE_H
