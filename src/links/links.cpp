#include "postbuild/links.hpp"
#include "postbuild/template.hpp"

#include <cerrno>
#include <filesystem>
#include <set>

#include <glob.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace postbuild {

namespace fs = std::filesystem;

namespace {

bool entry_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

Result<std::vector<std::string>> string_or_list(const nlohmann::json& value,
                                                const std::string& where) {
    std::vector<std::string> out;
    if (value.is_string()) {
        out.push_back(value.get<std::string>());
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    if (value.is_array()) {
        for (const auto& item : value) {
            if (!item.is_string()) {
                return Result<std::vector<std::string>>::err(Error(ErrorCode::INVALID_SPEC,
                    where + " must be a string or a list of strings"));
            }
            out.push_back(item.get<std::string>());
        }
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    return Result<std::vector<std::string>>::err(Error(ErrorCode::INVALID_SPEC,
        where + " must be a string or a list of strings"));
}

// Path of match relative to prefix, or its base name without a prefix
Result<std::string> placement_of(const std::string& match,
                                 const std::optional<std::string>& prefix) {
    if (!prefix) {
        return Result<std::string>::ok(fs::path(match).filename().string());
    }
    std::string rel = relative_path(match, *prefix);
    if (rel == "." || rel == ".." || rel.rfind("../", 0) == 0) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_SPEC,
            match + " does not start with prefix " + *prefix));
    }
    return Result<std::string>::ok(rel);
}

VoidResult make_parent_dirs(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return VoidResult::err(Error(ErrorCode::IO_ERROR,
            "cannot create directory " + path.parent_path().string() + ": " + ec.message()));
    }
    return VoidResult::ok();
}

VoidResult make_symlink(const std::string& to, const fs::path& at) {
    if (symlink(to.c_str(), at.c_str()) != 0) {
        return VoidResult::err(errno_error(errno, "cannot create symlink " + at.string()));
    }
    return VoidResult::ok();
}

VoidResult place(LinkAction action, const std::string& match, const fs::path& dest,
                 const std::optional<std::string>& launcher_program) {
    if (entry_exists(dest)) {
        return VoidResult::err(Error(ErrorCode::TARGET_EXISTS, dest.string() + " already exists"));
    }
    auto parents = make_parent_dirs(dest);
    if (parents.isErr()) {
        return parents;
    }

    switch (action) {
        case LinkAction::Symlink:
            return make_symlink(match, dest);

        case LinkAction::Copy: {
            std::error_code ec;
            fs::copy(match, dest, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            if (ec) {
                return VoidResult::err(Error(ErrorCode::IO_ERROR,
                    "cannot copy " + match + " to " + dest.string() + ": " + ec.message()));
            }
            return VoidResult::ok();
        }

        case LinkAction::Launcher: {
            fs::path link_path = dest.string() + ".link";
            if (entry_exists(link_path)) {
                return VoidResult::err(Error(ErrorCode::TARGET_EXISTS,
                    link_path.string() + " already exists"));
            }
            auto launcher = make_symlink(
                relative_path(*launcher_program, dest.parent_path().string()), dest);
            if (launcher.isErr()) {
                return launcher;
            }
            return make_symlink(match, link_path);
        }

        case LinkAction::Exclude:
            break;
    }
    return VoidResult::ok();
}

} // namespace

Result<LinkAction> parse_link_action(const std::string& name) {
    if (name == "exclude") return Result<LinkAction>::ok(LinkAction::Exclude);
    if (name == "symlink") return Result<LinkAction>::ok(LinkAction::Symlink);
    if (name == "copy") return Result<LinkAction>::ok(LinkAction::Copy);
    if (name == "launcher") return Result<LinkAction>::ok(LinkAction::Launcher);
    return Result<LinkAction>::err(Error(ErrorCode::INVALID_SPEC, "unknown link action: " + name));
}

Result<std::vector<LinkRule>> parse_link_rules(const nlohmann::json& doc) {
    std::vector<LinkRule> rules;
    if (!doc.is_array()) {
        return Result<std::vector<LinkRule>>::err(Error(ErrorCode::INVALID_SPEC,
            "links document must be a list of rules"));
    }

    for (size_t i = 0; i < doc.size(); ++i) {
        const auto& j = doc[i];
        std::string where = "links[" + std::to_string(i) + "]";
        if (!j.is_object() || !j.contains("action") || !j["action"].is_string()) {
            return Result<std::vector<LinkRule>>::err(Error(ErrorCode::INVALID_SPEC,
                where + " must be an object with a string \"action\""));
        }

        LinkRule rule;
        auto action = parse_link_action(j["action"].get<std::string>());
        if (action.isErr()) {
            return Result<std::vector<LinkRule>>::err(action.error().withContext(where));
        }
        rule.action = action.value();

        if (!j.contains("select")) {
            return Result<std::vector<LinkRule>>::err(Error(ErrorCode::INVALID_SPEC,
                where + " needs \"select\""));
        }
        auto select = string_or_list(j["select"], where + ".select");
        if (select.isErr()) {
            return Result<std::vector<LinkRule>>::err(select.error());
        }
        rule.select = std::move(select.value());

        if (j.contains("prefix")) {
            if (!j["prefix"].is_string()) {
                return Result<std::vector<LinkRule>>::err(Error(ErrorCode::INVALID_SPEC,
                    where + ".prefix must be a string"));
            }
            rule.prefix = j["prefix"].get<std::string>();
        }

        if (rule.action != LinkAction::Exclude) {
            if (!j.contains("target") || !j["target"].is_string()) {
                return Result<std::vector<LinkRule>>::err(Error(ErrorCode::INVALID_SPEC,
                    where + " needs a string \"target\""));
            }
            rule.target = j["target"].get<std::string>();
        }

        rules.push_back(std::move(rule));
    }

    return Result<std::vector<LinkRule>>::ok(std::move(rules));
}

Result<std::vector<std::string>> expand_glob(const std::string& pattern) {
    std::vector<std::string> matches;
    glob_t g;
    int rc = glob(pattern.c_str(), 0, nullptr, &g);
    if (rc == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i) {
            matches.push_back(g.gl_pathv[i]);
        }
    }
    globfree(&g);

    if (rc != 0 && rc != GLOB_NOMATCH) {
        return Result<std::vector<std::string>>::err(Error(ErrorCode::IO_ERROR,
            "glob failed for " + pattern));
    }
    return Result<std::vector<std::string>>::ok(std::move(matches));
}

VoidResult GlobLinksExecutor::execute(const std::vector<LinkRule>& rules,
                                      const EnvMap& env,
                                      const std::optional<std::string>& launcher_program) {
    for (const auto& rule : rules) {
        if (rule.action == LinkAction::Launcher && !launcher_program) {
            return VoidResult::err(Error(ErrorCode::MISSING_LAUNCHER,
                "launcher rule given but no launcher program is available"));
        }
    }

    // Substitute every rule up front so a bad template links nothing
    std::vector<LinkRule> resolved;
    for (const auto& rule : rules) {
        LinkRule r;
        r.action = rule.action;
        if (rule.prefix) {
            auto p = substitute_template(*rule.prefix, env);
            if (p.isErr()) return VoidResult::err(p.error().withContext("prefix"));
            r.prefix = p.value();
        }
        if (rule.action != LinkAction::Exclude) {
            auto t = substitute_template(rule.target, env);
            if (t.isErr()) return VoidResult::err(t.error().withContext("target"));
            r.target = t.value();
        }
        for (const auto& select : rule.select) {
            auto pattern = substitute_template(select, env);
            if (pattern.isErr()) {
                return VoidResult::err(pattern.error().withContext("select \"" + select + "\""));
            }
            r.select.push_back(pattern.value());
        }
        resolved.push_back(std::move(r));
    }

    std::set<std::string> taken;

    for (const auto& rule : resolved) {
        for (const auto& pattern : rule.select) {
            auto matches = expand_glob(pattern);
            if (matches.isErr()) {
                return VoidResult::err(matches.error());
            }

            for (const auto& raw : matches.value()) {
                std::string match = absolute_normal(raw);
                if (!taken.insert(match).second) {
                    continue;
                }
                if (rule.action == LinkAction::Exclude) {
                    continue;
                }

                auto rel = placement_of(match, rule.prefix);
                if (rel.isErr()) {
                    return VoidResult::err(rel.error());
                }
                fs::path dest = fs::path(rule.target) / rel.value();
                auto placed = place(rule.action, match, dest, launcher_program);
                if (placed.isErr()) {
                    return placed;
                }
                spdlog::debug("links: {} -> {}", dest.string(), match);
            }
        }
    }

    return VoidResult::ok();
}

} // namespace postbuild
