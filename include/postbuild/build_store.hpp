#pragma once

#include <optional>
#include <string>

namespace postbuild {

// ============================================================================
// Artifact Resolution
// ============================================================================

/**
 * @brief Maps artifact ids to the directories holding them
 */
class ArtifactResolver {
public:
    virtual ~ArtifactResolver() = default;

    // Directory of an artifact, or nullopt if it is not available
    virtual std::optional<std::string> resolve(const std::string& artifact_id) const = 0;

    // Directory builds run in
    virtual std::string build_dir() const = 0;
};

/**
 * @brief Directory-backed store: artifact "name/hash" lives at
 * <artifact_root>/name/hash
 */
class BuildStore : public ArtifactResolver {
public:
    BuildStore(std::string artifact_root, std::string build_dir);

    std::optional<std::string> resolve(const std::string& artifact_id) const override;
    std::string build_dir() const override { return build_dir_; }

    const std::string& artifact_root() const { return artifact_root_; }

private:
    std::string artifact_root_;
    std::string build_dir_;
};

// True for well-formed "name/hash" ids: relative, no empty or ".." components
bool is_valid_artifact_id(const std::string& artifact_id);

} // namespace postbuild
