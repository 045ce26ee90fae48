#pragma once

#include "postbuild/build_spec.hpp"
#include "postbuild/build_store.hpp"
#include "postbuild/result.hpp"

#include <set>
#include <string>
#include <vector>

namespace postbuild {

// ============================================================================
// Profile Manifest
// ============================================================================

// Files a profile push created, persisted as
//   {"installed-files": ["/abs/path", ...]}
struct ProfileManifest {
    std::set<std::string> installed_files;
};

std::string serialize_manifest(const ProfileManifest& manifest);
Result<ProfileManifest> parse_manifest(const std::string& json_str);

Result<ProfileManifest> read_manifest(const std::string& path);
VoidResult write_manifest(const std::string& path, const ProfileManifest& manifest);

// ============================================================================
// Profile Farm
// ============================================================================

/**
 * @brief Populates a directory with a view of several artifacts
 */
class ProfileFarmBuilder {
public:
    virtual ~ProfileFarmBuilder() = default;

    virtual VoidResult make_profile(const std::vector<ArtifactImport>& imports,
                                    const std::string& target_dir,
                                    const VirtualsMap& virtuals) = 0;
};

/**
 * @brief Mirrors artifact files into the target as absolute symlinks
 *
 * Imports are processed in order and the first artifact providing a path
 * wins; existing entries in the target are never replaced. Artifact
 * metadata at the artifact root is not linked. A "profile.json" marker
 * listing the imported ids is written unless the target already has one.
 */
class SymlinkFarmBuilder : public ProfileFarmBuilder {
public:
    explicit SymlinkFarmBuilder(const ArtifactResolver& resolver) : resolver_(resolver) {}

    VoidResult make_profile(const std::vector<ArtifactImport>& imports,
                            const std::string& target_dir,
                            const VirtualsMap& virtuals) override;

private:
    VoidResult link_artifact(const std::string& artifact_dir, const std::string& target_dir);

    const ArtifactResolver& resolver_;
};

// Names at an artifact root that are never linked into a profile
bool is_artifact_metadata(const std::string& relative_path);

// ============================================================================
// Push / Pop
// ============================================================================

struct ProfilePushOptions {
    std::string target_dir;       // directory the profile is built in
    std::string build_spec_path;  // build.json; imports come from "build.import"
    std::string manifest_path;    // where the manifest is written
    VirtualsMap virtuals;
};

/**
 * Build the profile and record exactly the files it added.
 *
 * Enumerates target_dir, runs the farm builder, enumerates again and writes
 * the difference to options.manifest_path. Files already present are never
 * touched.
 */
Result<ProfileManifest> push_build_profile(const ProfilePushOptions& options,
                                           ProfileFarmBuilder& builder);

/**
 * Remove every file in the manifest, then each emptied parent directory up
 * to (not including) root.
 *   MISSING_FILE   - a listed file no longer exists
 *   PATH_TRAVERSAL - a listed file is not below root
 */
VoidResult pop_build_profile(const ProfileManifest& manifest, const std::string& root);

// Read the manifest at manifest_path, pop it and delete the manifest file
VoidResult pop_build_profile_file(const std::string& manifest_path, const std::string& root);

} // namespace postbuild
