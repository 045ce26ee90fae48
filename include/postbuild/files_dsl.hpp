#pragma once

#include "postbuild/platform.hpp"
#include "postbuild/result.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace postbuild {

// ============================================================================
// Files DSL
// ============================================================================
//
// The "files" section of a build spec declares small files to write before
// the build runs:
//
//   {"target": "$ARTIFACT/etc/x.cfg", "text": ["a=1", "b=$B"], "expandvars": true}
//   {"target": "meta.json", "object": {"k": [1, 2]}, "executable": false}
//
// Output depends only on the file entry and the environment: text lines are joined
// with "\n" and objects are written as canonical JSON.

struct TextContent {
    std::vector<std::string> lines;
    bool expandvars = false;
};

struct ObjectContent {
    nlohmann::json value;
};

using FileContent = std::variant<TextContent, ObjectContent>;

struct FileSpec {
    std::string target;       // template, substituted against the environment
    FileContent content;
    bool executable = false;

    unsigned mode() const { return executable ? 0755u : 0644u; }
};

// Validate and convert a JSON "files" list.
//   INVALID_SPEC  - not a list, missing target, neither or both of text/object
//   UNSUPPORTED   - "expandvars" given together with "object"
Result<std::vector<FileSpec>> parse_file_specs(const nlohmann::json& files);

// Canonical serialization used for "object" content: sorted keys, two-space
// indentation, no trailing newline
std::string canonical_json(const nlohmann::json& value);

// Render the bytes a spec writes (after expandvars substitution)
Result<std::string> render_file_content(const FileSpec& spec, const EnvMap& env);

// Write every spec in order. Relative targets are relative to the current
// working directory. Stops at the first error; files already written stay.
//   MISSING_VARIABLE / INVALID_SPEC - bad substitution in target or text
//   TARGET_EXISTS                   - target already present (O_EXCL)
VoidResult execute_files_dsl(const std::vector<FileSpec>& specs, const EnvMap& env);

} // namespace postbuild
