// modules/artifact/artifact_store.h
#ifndef AGENTRT_MODULES_ARTIFACT_ARTIFACT_STORE_H
#define AGENTRT_MODULES_ARTIFACT_ARTIFACT_STORE_H

#include "core/types/content.h"
#include <optional>
#include <string>
#include <vector>

namespace agentrt {

// Versioned blob storage keyed by (app, user, session, filename). Filenames
// starting with "user:" are shared by every session of the user.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    // Returns the new version, starting at 0
    virtual int save_artifact(const std::string& app_name,
                              const std::string& user_id,
                              const std::string& session_id,
                              const std::string& filename,
                              const Part& artifact) = 0;

    // Latest version when version is not given; nullopt if absent
    virtual std::optional<Part> load_artifact(const std::string& app_name,
                                              const std::string& user_id,
                                              const std::string& session_id,
                                              const std::string& filename,
                                              std::optional<int> version = std::nullopt) = 0;

    // Session-scoped and user-scoped filenames, sorted
    virtual std::vector<std::string> list_artifact_keys(const std::string& app_name,
                                                        const std::string& user_id,
                                                        const std::string& session_id) = 0;

    virtual std::vector<int> list_versions(const std::string& app_name,
                                           const std::string& user_id,
                                           const std::string& session_id,
                                           const std::string& filename) = 0;

    virtual void delete_artifact(const std::string& app_name,
                                 const std::string& user_id,
                                 const std::string& session_id,
                                 const std::string& filename) = 0;
};

bool is_user_scoped_artifact(const std::string& filename);

} // namespace agentrt

#endif // AGENTRT_MODULES_ARTIFACT_ARTIFACT_STORE_H
