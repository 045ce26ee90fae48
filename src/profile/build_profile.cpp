#include "postbuild/build_profile.hpp"
#include "postbuild/platform.hpp"
#include "postbuild/shebang.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <iterator>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

constexpr const char* MANIFEST_KEY = "installed-files";

bool entry_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

} // namespace

// ============================================================================
// Manifest
// ============================================================================

std::string serialize_manifest(const ProfileManifest& manifest) {
    nlohmann::json j;
    j[MANIFEST_KEY] = nlohmann::json::array();
    for (const auto& path : manifest.installed_files) {
        j[MANIFEST_KEY].push_back(path);
    }
    return j.dump(2) + "\n";
}

Result<ProfileManifest> parse_manifest(const std::string& json_str) {
    ProfileManifest manifest;
    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object() || !j.contains(MANIFEST_KEY) || !j[MANIFEST_KEY].is_array()) {
            return Result<ProfileManifest>::err(Error(ErrorCode::INVALID_SPEC,
                std::string("manifest must contain a \"") + MANIFEST_KEY + "\" list"));
        }
        for (const auto& path : j[MANIFEST_KEY]) {
            if (!path.is_string()) {
                return Result<ProfileManifest>::err(Error(ErrorCode::INVALID_SPEC,
                    "manifest entries must be strings"));
            }
            manifest.installed_files.insert(path.get<std::string>());
        }
    } catch (const nlohmann::json::parse_error& e) {
        return Result<ProfileManifest>::err(Error(ErrorCode::INVALID_SPEC,
            std::string("invalid manifest JSON: ") + e.what()));
    }
    return Result<ProfileManifest>::ok(std::move(manifest));
}

Result<ProfileManifest> read_manifest(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        return Result<ProfileManifest>::err(Error(ErrorCode::FILE_NOT_FOUND,
            "cannot read manifest " + path));
    }
    auto manifest = parse_manifest(*content);
    if (manifest.isErr()) {
        manifest.error().withContext(path);
    }
    return manifest;
}

VoidResult write_manifest(const std::string& path, const ProfileManifest& manifest) {
    auto result = atomic_write_file(path, serialize_manifest(manifest));
    if (!result.ok) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR, result.error));
    }
    return VoidResult::ok();
}

// ============================================================================
// Symlink Farm
// ============================================================================

bool is_artifact_metadata(const std::string& relative_path) {
    static const char* const names[] = {"artifact.json", "build.json", "build.log", "build.log.gz"};
    return std::any_of(std::begin(names), std::end(names),
                       [&](const char* name) { return relative_path == name; });
}

VoidResult SymlinkFarmBuilder::link_artifact(const std::string& artifact_dir,
                                             const std::string& target_dir) {
    auto files = list_files_recursive(artifact_dir);
    if (files.isErr()) {
        return VoidResult::err(files.error());
    }

    for (const auto& source : files.value()) {
        std::string rel = relative_path(source, artifact_dir);
        if (is_artifact_metadata(rel)) {
            continue;
        }

        fs::path dest = fs::path(target_dir) / rel;
        if (entry_exists(dest)) {
            spdlog::debug("profile: {} already present, keeping it", dest.string());
            continue;
        }

        std::error_code ec;
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR,
                "cannot create directory " + dest.parent_path().string() + ": " + ec.message()));
        }
        if (symlink(source.c_str(), dest.c_str()) != 0) {
            return VoidResult::err(errno_error(errno, "cannot link " + dest.string()));
        }
    }
    return VoidResult::ok();
}

VoidResult SymlinkFarmBuilder::make_profile(const std::vector<ArtifactImport>& imports,
                                            const std::string& target_dir,
                                            const VirtualsMap& virtuals) {
    nlohmann::json ids = nlohmann::json::array();

    for (const auto& imp : imports) {
        auto id = resolve_virtual(imp.id, virtuals);
        if (id.isErr()) {
            return VoidResult::err(id.error());
        }
        auto dir = resolver_.resolve(id.value());
        if (!dir) {
            return VoidResult::err(Error(ErrorCode::ARTIFACT_NOT_FOUND,
                "artifact not found: " + id.value()));
        }
        spdlog::debug("profile: linking {} from {}", id.value(), *dir);
        auto linked = link_artifact(*dir, target_dir);
        if (linked.isErr()) {
            return linked;
        }
        ids.push_back(id.value());
    }

    fs::path marker = fs::path(target_dir) / PROFILE_MARKER_FILE;
    if (!entry_exists(marker)) {
        std::error_code ec;
        fs::create_directories(target_dir, ec);
        nlohmann::json j;
        j["artifacts"] = ids;
        auto result = atomic_write_file(marker.string(), j.dump(2) + "\n");
        if (!result.ok) {
            return VoidResult::err(Error(ErrorCode::IO_ERROR, result.error));
        }
    }
    return VoidResult::ok();
}

// ============================================================================
// Push / Pop
// ============================================================================

Result<ProfileManifest> push_build_profile(const ProfilePushOptions& options,
                                           ProfileFarmBuilder& builder) {
    auto spec = load_json_parameters(options.build_spec_path, "");
    if (spec.isErr()) {
        return Result<ProfileManifest>::err(spec.error());
    }
    auto imports = parse_imports(spec.value());
    if (imports.isErr()) {
        return Result<ProfileManifest>::err(imports.error());
    }

    auto before = list_files_recursive(options.target_dir);
    if (before.isErr()) {
        return Result<ProfileManifest>::err(before.error());
    }

    auto made = builder.make_profile(imports.value(), options.target_dir, options.virtuals);
    if (made.isErr()) {
        return Result<ProfileManifest>::err(made.error());
    }

    auto after = list_files_recursive(options.target_dir);
    if (after.isErr()) {
        return Result<ProfileManifest>::err(after.error());
    }

    ProfileManifest manifest;
    std::set_difference(after.value().begin(), after.value().end(),
                        before.value().begin(), before.value().end(),
                        std::inserter(manifest.installed_files, manifest.installed_files.end()));

    auto written = write_manifest(options.manifest_path, manifest);
    if (written.isErr()) {
        return Result<ProfileManifest>::err(written.error());
    }

    spdlog::debug("profile push added {} file(s) to {}", manifest.installed_files.size(),
                  options.target_dir);
    return Result<ProfileManifest>::ok(std::move(manifest));
}

VoidResult pop_build_profile(const ProfileManifest& manifest, const std::string& root) {
    fs::path boundary(absolute_normal(root));

    // Every entry is checked before the first unlink
    std::vector<fs::path> files;
    for (const auto& path : manifest.installed_files) {
        if (!entry_exists(path)) {
            return VoidResult::err(Error(ErrorCode::MISSING_FILE,
                "file listed in profile manifest is missing: " + path));
        }
        fs::path file(absolute_normal(path));
        if (file == boundary || !is_under(file, boundary)) {
            return VoidResult::err(Error(ErrorCode::PATH_TRAVERSAL,
                path + " is not below " + root));
        }
        files.push_back(std::move(file));
    }

    for (const auto& file : files) {
        if (unlink(file.c_str()) != 0) {
            return VoidResult::err(errno_error(errno, "cannot remove " + file.string()));
        }
        auto removed = remove_empty_dirs_up_to(file.parent_path().string(), boundary.string());
        if (removed.isErr()) {
            return removed;
        }
    }

    spdlog::debug("profile pop removed {} file(s)", files.size());
    return VoidResult::ok();
}

VoidResult pop_build_profile_file(const std::string& manifest_path, const std::string& root) {
    auto manifest = read_manifest(manifest_path);
    if (manifest.isErr()) {
        return VoidResult::err(manifest.error());
    }

    auto popped = pop_build_profile(manifest.value(), root);
    if (popped.isErr()) {
        return popped;
    }

    if (unlink(manifest_path.c_str()) != 0) {
        return VoidResult::err(errno_error(errno, "cannot remove manifest " + manifest_path));
    }
    return VoidResult::ok();
}

} // namespace postbuild
