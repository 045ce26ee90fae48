#pragma once

#include "postbuild/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace postbuild {

// ============================================================================
// Build Document
// ============================================================================
//
// build.json is an object with optional keys:
//   "sources": [{"key": ..., "target": ..., "strip": ...}, ...]
//   "files":   [FileSpec objects, see files_dsl.hpp]
//   "build":   {"import": [{"id": ..., "ref": ..., "in_env": ...}, ...]}

// Load a JSON file and descend into it along a "/"-separated key path.
// Empty path segments are skipped, so "/" and "" select the whole document.
Result<nlohmann::json> load_json_parameters(const std::string& path, const std::string& key);

// Descend into an already parsed document (see load_json_parameters)
Result<nlohmann::json> select_json_key(const nlohmann::json& doc, const std::string& key);

// ============================================================================
// Artifact Imports
// ============================================================================

inline constexpr const char* VIRTUAL_PREFIX = "virtual:";

struct ArtifactImport {
    std::string id;                   // "name/hash" or "virtual:name"
    std::optional<std::string> ref;   // variable name used in build scripts
    bool in_env = true;

    bool is_virtual() const { return id.rfind(VIRTUAL_PREFIX, 0) == 0; }
};

// Virtual name -> concrete artifact id
using VirtualsMap = std::unordered_map<std::string, std::string>;

// Parse the "build.import" list of a build spec. A missing key is an empty list.
Result<std::vector<ArtifactImport>> parse_imports(const nlohmann::json& build_spec);

// Parse HDIST_VIRTUALS ("virtual:a=a/h1;virtual:b=b/h2"). Empty input is an empty map.
Result<VirtualsMap> parse_virtuals(const std::string& encoded);

// Inverse of parse_virtuals, entries sorted by name
std::string format_virtuals(const VirtualsMap& virtuals);

// Map a virtual import id to its concrete id; non-virtual ids pass through
Result<std::string> resolve_virtual(const std::string& id, const VirtualsMap& virtuals);

// Parse the space-separated HDIST_IMPORT list
std::vector<std::string> parse_import_envvar(const std::string& value);

// ============================================================================
// Sources
// ============================================================================

struct SourceItem {
    std::string key;          // e.g. "tar.gz:<sha256>"
    std::string target = ".";
    int strip = 0;
};

Result<std::vector<SourceItem>> parse_source_items(const nlohmann::json& doc);

} // namespace postbuild
