#pragma once

#include "postbuild/platform.hpp"
#include "postbuild/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace postbuild {

// ============================================================================
// Links DSL
// ============================================================================
//
// An ordered list of rules placing existing files into a tree:
//
//   [{"action": "exclude", "select": "$ARTIFACT/bin/*-config"},
//    {"action": "symlink", "select": "$ARTIFACT/bin/*", "prefix": "$ARTIFACT",
//     "target": "$PROFILE"}]
//
// A path matched by one rule is not considered by later rules.

enum class LinkAction {
    Exclude,
    Symlink,
    Copy,
    Launcher,
};

struct LinkRule {
    LinkAction action = LinkAction::Symlink;
    std::vector<std::string> select;  // glob templates
    std::optional<std::string> prefix;
    std::string target;               // required unless action is Exclude
};

Result<LinkAction> parse_link_action(const std::string& name);

// INVALID_SPEC for a malformed rule list
Result<std::vector<LinkRule>> parse_link_rules(const nlohmann::json& doc);

/**
 * @brief Executes links DSL documents
 */
class LinksExecutor {
public:
    virtual ~LinksExecutor() = default;

    virtual VoidResult execute(const std::vector<LinkRule>& rules,
                               const EnvMap& env,
                               const std::optional<std::string>& launcher_program) = 0;
};

/**
 * @brief Expands selections with glob(3) and acts on the local filesystem
 *
 * The matched path with `prefix` removed (the base name when no prefix is
 * given) is placed below `target`.
 *   symlink  - absolute symlink to the match
 *   copy     - copy, keeping permissions
 *   launcher - relative symlink to the launcher program, plus "<name>.link"
 *              pointing at the match
 * Templates of all rules are substituted before anything is placed.
 * TARGET_EXISTS if a destination exists, MISSING_LAUNCHER if a launcher rule
 * runs without a launcher program.
 */
class GlobLinksExecutor : public LinksExecutor {
public:
    VoidResult execute(const std::vector<LinkRule>& rules,
                       const EnvMap& env,
                       const std::optional<std::string>& launcher_program) override;
};

// Expand one glob pattern, sorted. No matches is an empty list.
Result<std::vector<std::string>> expand_glob(const std::string& pattern);

} // namespace postbuild
